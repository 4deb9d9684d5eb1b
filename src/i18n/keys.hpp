/**
 * @file    keys.hpp
 * @brief   String key definitions for i18n
 * @license MIT
 *
 * @details
 * All translatable string keys are defined here as constexpr string_view.
 *
 * Naming convention:
 *   - menu.<menu>.<item>     : Menu items
 *   - toolbar.<action>       : Toolbar buttons
 *   - panel.<section>.<item> : Left panel
 *   - status.<state>         : Status bar messages
 *   - dialog.<name>.<item>   : Dialog content
 *   - view.<item>            : Annotation view area
 *   - cli.<context>          : CLI messages
 */

#pragma once

#include <string_view>

namespace bba::i18n::keys {

// =============================================================================
// Menu - File
// =============================================================================
constexpr std::string_view MENU_FILE = "menu.file";
constexpr std::string_view MENU_FILE_OPEN_IMAGE = "menu.file.open_image";
constexpr std::string_view MENU_FILE_OPEN_DIR = "menu.file.open_dir";
constexpr std::string_view MENU_FILE_OUTPUT_DIR = "menu.file.output_dir";
constexpr std::string_view MENU_FILE_SAVE = "menu.file.save";
constexpr std::string_view MENU_FILE_EXIT = "menu.file.exit";

// =============================================================================
// Menu - View
// =============================================================================
constexpr std::string_view MENU_VIEW = "menu.view";
constexpr std::string_view MENU_VIEW_APPEARANCE = "menu.view.appearance";
constexpr std::string_view MENU_VIEW_FIT = "menu.view.fit";
constexpr std::string_view MENU_VIEW_ZOOM_IN = "menu.view.zoom_in";
constexpr std::string_view MENU_VIEW_ZOOM_OUT = "menu.view.zoom_out";

// =============================================================================
// Menu - Logging / Help
// =============================================================================
constexpr std::string_view MENU_LOGGING = "menu.logging";
constexpr std::string_view MENU_LOGGING_VIEW = "menu.logging.view";
constexpr std::string_view MENU_HELP = "menu.help";
constexpr std::string_view MENU_HELP_LANGUAGE = "menu.help.language";
constexpr std::string_view MENU_HELP_ABOUT = "menu.help.about";

// =============================================================================
// Toolbar
// =============================================================================
constexpr std::string_view TOOLBAR_OPEN = "toolbar.open";
constexpr std::string_view TOOLBAR_OPEN_DIR = "toolbar.open_dir";
constexpr std::string_view TOOLBAR_SAVE = "toolbar.save";
constexpr std::string_view TOOLBAR_DRAW = "toolbar.draw";
constexpr std::string_view TOOLBAR_EDIT = "toolbar.edit";
constexpr std::string_view TOOLBAR_FIT = "toolbar.fit";
constexpr std::string_view TOOLBAR_PREV = "toolbar.prev";
constexpr std::string_view TOOLBAR_NEXT = "toolbar.next";

// =============================================================================
// Left Panel
// =============================================================================
constexpr std::string_view PANEL_FILES_TITLE = "panel.files.title";
constexpr std::string_view PANEL_FILES_EMPTY = "panel.files.empty";
constexpr std::string_view PANEL_LABEL_TITLE = "panel.label.title";
constexpr std::string_view PANEL_LABEL_HINT = "panel.label.hint";
constexpr std::string_view PANEL_LABELS_USED = "panel.labels.used";
constexpr std::string_view PANEL_LABELS_NONE = "panel.labels.none";
constexpr std::string_view PANEL_ANNOTATIONS_TITLE = "panel.annotations.title";
constexpr std::string_view PANEL_ANNOTATIONS_GROUP = "panel.annotations.group";
constexpr std::string_view PANEL_ANNOTATIONS_EDIT = "panel.annotations.edit";
constexpr std::string_view PANEL_ANNOTATIONS_DELETE = "panel.annotations.delete";
constexpr std::string_view PANEL_STATS_TITLE = "panel.stats.title";
constexpr std::string_view PANEL_STATS_COUNT = "panel.stats.count";

// =============================================================================
// Annotation View
// =============================================================================
constexpr std::string_view VIEW_PLACEHOLDER = "view.placeholder";
constexpr std::string_view VIEW_HINT = "view.hint";

// =============================================================================
// Status Bar
// =============================================================================
constexpr std::string_view STATUS_READY = "status.ready";
constexpr std::string_view STATUS_LOADED = "status.loaded";
constexpr std::string_view STATUS_SAVED = "status.saved";
constexpr std::string_view STATUS_NO_CHANGES = "status.no_changes";
constexpr std::string_view STATUS_UNSAVED = "status.unsaved";
constexpr std::string_view STATUS_ZOOM = "status.zoom";
constexpr std::string_view STATUS_IMAGE_SIZE = "status.image_size";
constexpr std::string_view STATUS_OPENED_DIR = "status.opened_dir";
constexpr std::string_view STATUS_OUTPUT_DIR = "status.output_dir";
constexpr std::string_view STATUS_DELETED = "status.deleted";
constexpr std::string_view STATUS_RENAMED = "status.renamed";
constexpr std::string_view STATUS_MODE_DRAW = "status.mode_draw";
constexpr std::string_view STATUS_MODE_EDIT = "status.mode_edit";
constexpr std::string_view STATUS_ERROR = "status.error";

// =============================================================================
// Dialogs - Common
// =============================================================================
constexpr std::string_view DIALOG_OK = "dialog.ok";
constexpr std::string_view DIALOG_CANCEL = "dialog.cancel";
constexpr std::string_view DIALOG_CLOSE = "dialog.close";
constexpr std::string_view DIALOG_YES = "dialog.yes";
constexpr std::string_view DIALOG_NO = "dialog.no";
constexpr std::string_view DIALOG_ERROR_TITLE = "dialog.error.title";

// =============================================================================
// Dialogs - About / Unsaved
// =============================================================================
constexpr std::string_view DIALOG_ABOUT_TITLE = "dialog.about.title";
constexpr std::string_view DIALOG_ABOUT_DESCRIPTION = "dialog.about.description";
constexpr std::string_view DIALOG_ABOUT_VERSION = "dialog.about.version";
constexpr std::string_view DIALOG_ABOUT_LICENSE = "dialog.about.license";
constexpr std::string_view DIALOG_UNSAVED_TITLE = "dialog.unsaved.title";
constexpr std::string_view DIALOG_UNSAVED_MESSAGE = "dialog.unsaved.message";

// =============================================================================
// Dialogs - Labels
// =============================================================================
constexpr std::string_view DIALOG_EDIT_LABEL_TITLE = "dialog.edit_label.title";
constexpr std::string_view DIALOG_EDIT_LABEL_PROMPT = "dialog.edit_label.prompt";
constexpr std::string_view DIALOG_DELETE_TITLE = "dialog.delete.title";
constexpr std::string_view DIALOG_DELETE_SINGLE = "dialog.delete.single";
constexpr std::string_view DIALOG_DELETE_GROUP = "dialog.delete.group";

// =============================================================================
// Dialogs - Appearance
// =============================================================================
constexpr std::string_view DIALOG_APPEARANCE_TITLE = "dialog.appearance.title";
constexpr std::string_view DIALOG_APPEARANCE_BBOX_COLOR = "dialog.appearance.bbox_color";
constexpr std::string_view DIALOG_APPEARANCE_SELECTED_COLOR = "dialog.appearance.selected_color";
constexpr std::string_view DIALOG_APPEARANCE_LABEL_COLOR = "dialog.appearance.label_color";
constexpr std::string_view DIALOG_APPEARANCE_POINTS_COLOR = "dialog.appearance.points_color";
constexpr std::string_view DIALOG_APPEARANCE_LINE_WIDTH = "dialog.appearance.line_width";
constexpr std::string_view DIALOG_APPEARANCE_POINTS_SIZE = "dialog.appearance.points_size";
constexpr std::string_view DIALOG_APPEARANCE_FONT_SIZE = "dialog.appearance.font_size";
constexpr std::string_view DIALOG_APPEARANCE_THEME = "dialog.appearance.theme";
constexpr std::string_view DIALOG_APPEARANCE_THEME_LIGHT = "dialog.appearance.theme_light";
constexpr std::string_view DIALOG_APPEARANCE_THEME_DARK = "dialog.appearance.theme_dark";
constexpr std::string_view DIALOG_APPEARANCE_RESET = "dialog.appearance.reset";

// =============================================================================
// Dialogs - Log Viewer
// =============================================================================
constexpr std::string_view DIALOG_LOGS_TITLE = "dialog.logs.title";
constexpr std::string_view DIALOG_LOGS_LEVEL = "dialog.logs.level";
constexpr std::string_view DIALOG_LOGS_FILTER = "dialog.logs.filter";
constexpr std::string_view DIALOG_LOGS_CLEAR = "dialog.logs.clear";
constexpr std::string_view DIALOG_LOGS_AUTO_SCROLL = "dialog.logs.auto_scroll";

// =============================================================================
// CLI Messages
// =============================================================================
constexpr std::string_view CLI_DESCRIPTION = "cli.description";
constexpr std::string_view CLI_NO_IMAGES = "cli.no_images";
constexpr std::string_view CLI_NO_LABELS = "cli.no_labels";
constexpr std::string_view CLI_UPGRADED = "cli.upgraded";
constexpr std::string_view CLI_WOULD_UPGRADE = "cli.would_upgrade";
constexpr std::string_view CLI_CANONICAL = "cli.canonical";
constexpr std::string_view CLI_RENDERED = "cli.rendered";
constexpr std::string_view CLI_SUMMARY = "cli.summary";

}  // namespace bba::i18n::keys
