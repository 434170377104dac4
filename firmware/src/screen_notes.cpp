/**
 * InkDeck - Notes Screens
 * Notes menu, note creation and the list/viewer/editor
 */

#include "screens.h"
#include "config.h"
#include <stdio.h>

// ==================== Notes Menu ====================

static const char* const NOTES_MENU_OPTIONS[] = {
    "1. Create New Note",
    "2. View/Edit Notes",
};

#define NOTES_MENU_COUNT    2

NotesMenuScreen::NotesMenuScreen() : ctx_(nullptr), selected_(0) {}

void NotesMenuScreen::enter(AppContext& ctx) {
    ctx_ = &ctx;
    selected_ = 0;
}

void NotesMenuScreen::render(Canvas& canvas, const Palette& palette) const {
    canvas.fillScreen(palette.background);
    printCentered(canvas, "NOTES", 5, 2, palette.foreground);

    for (int i = 0; i < NOTES_MENU_COUNT; ++i) {
        int16_t y = 35 + i * 30;
        if (i == selected_) {
            canvas.drawText(10, y, ">", 2, palette.foreground);
        }
        canvas.drawText(25, y, NOTES_MENU_OPTIONS[i], 2, palette.foreground);
    }

    char count[24];
    snprintf(count, sizeof(count), "%u saved", static_cast<unsigned>(ctx_->notes.count()));
    canvas.drawText(canvas.width() - textWidth(count, 1) - 5, canvas.height() - FONT_CHAR_HEIGHT - 4,
                    count, 1, palette.foreground);
    printFooter(canvas, "ENTER=Open ESC=Back", palette.foreground);
}

Transition NotesMenuScreen::handleKey(const KeyEvent& key) {
    if (key.code == KEYCODE_ESC) {
        return Transition::go(SCREEN_MAIN_MENU);
    }
    if (key.code == KEYCODE_ENTER) {
        return Transition::go(selected_ == 0 ? SCREEN_CREATE_NOTE : SCREEN_VIEW_NOTES);
    }

    int previous = selected_;
    if (keyIsUp(key) && selected_ > 0) {
        selected_--;
    } else if (keyIsDown(key) && selected_ < NOTES_MENU_COUNT - 1) {
        selected_++;
    } else if (key.isChar('1') || key.isChar('2')) {
        selected_ = key.digit() - 1;
    }
    return selected_ != previous ? Transition::redraw() : Transition::stay();
}

// ==================== Create Note ====================

CreateNoteScreen::CreateNoteScreen() : ctx_(nullptr), stage_(STAGE_TITLE) {}

void CreateNoteScreen::enter(AppContext& ctx) {
    ctx_ = &ctx;
    stage_ = STAGE_TITLE;
    title_.clear();
    overlay_.clear();
    prompt_.begin("Note Title:", NOTE_TITLE_MAX_LEN);
}

void CreateNoteScreen::render(Canvas& canvas, const Palette& palette) const {
    if (overlay_.active) {
        overlay_.render(canvas, palette);
        return;
    }
    prompt_.render(canvas, palette, "NEW NOTE");
}

Transition CreateNoteScreen::handleKey(const KeyEvent& key) {
    if (stage_ == STAGE_SAVED) {
        return Transition::stay();
    }

    PromptResult result = prompt_.feed(key);
    if (result == PROMPT_ABORTED) {
        DEBUG_PRINTLN(g_debug_ui, "Notes: Create cancelled");
        return Transition::go(SCREEN_NOTES_MENU);
    }
    if (result == PROMPT_EDITING) {
        return Transition::redraw();
    }

    if (stage_ == STAGE_TITLE) {
        title_ = prompt_.value();
        stage_ = STAGE_CONTENT;
        prompt_.begin("Note Content:", NOTE_CONTENT_MAX_LEN);
        return Transition::redraw();
    }

    ctx_->notes.create(title_, prompt_.value());
    stage_ = STAGE_SAVED;
    overlay_.start(ctx_->clock.millis(), UI_NOTE_SAVED_MS,
                   ctx_->notes.lastSaveOk() ? "Note Saved!" : "Save Failed", "");
    return Transition::redraw();
}

Transition CreateNoteScreen::tick(uint32_t now_ms) {
    if (overlay_.expired(now_ms)) {
        overlay_.clear();
        return Transition::go(SCREEN_NOTES_MENU);
    }
    return Transition::stay();
}

// ==================== View Notes ====================

#define NOTE_ROW_HEIGHT     18
#define NOTE_LIST_TOP       20
#define NOTE_LINE_HEIGHT    12
#define NOTE_TITLE_CHARS    30
#define NOTE_ROW_CHARS      32

ViewNotesScreen::ViewNotesScreen()
    : ctx_(nullptr), mode_(MODE_LIST), selected_(0), scroll_(0), page_(0) {}

void ViewNotesScreen::enter(AppContext& ctx) {
    ctx_ = &ctx;
    mode_ = MODE_LIST;
    selected_ = 0;
    scroll_ = 0;
    page_ = 0;
    lines_.clear();
    edit_title_.clear();
    overlay_.clear();
}

const Note* ViewNotesScreen::selectedNote() const {
    const std::vector<Note>& notes = ctx_->notes.list();
    if (selected_ < 0 || selected_ >= static_cast<int>(notes.size())) {
        return nullptr;
    }
    return &notes[selected_];
}

int ViewNotesScreen::pageCount() const {
    int count = (static_cast<int>(lines_.size()) + NOTE_VIEW_LINES_PER_PAGE - 1) / NOTE_VIEW_LINES_PER_PAGE;
    return count < 1 ? 1 : count;
}

void ViewNotesScreen::openViewer() {
    const Note* note = selectedNote();
    if (note == nullptr) return;
    wrapText(note->content, NOTE_VIEW_CHARS_PER_LINE, lines_);
    page_ = 0;
    mode_ = MODE_VIEWER;
    DEBUG_PRINTF(g_debug_ui, "Notes: Viewing note %d (%u lines)\n", note->id,
                 static_cast<unsigned>(lines_.size()));
}

// ---- Rendering ----

void ViewNotesScreen::render(Canvas& canvas, const Palette& palette) const {
    if (overlay_.active) {
        overlay_.render(canvas, palette);
        return;
    }

    switch (mode_) {
        case MODE_LIST:
            if (ctx_->notes.count() == 0) {
                renderEmpty(canvas, palette);
            } else {
                renderList(canvas, palette);
            }
            break;
        case MODE_VIEWER:
            renderViewer(canvas, palette);
            break;
        case MODE_EDIT_TITLE:
        case MODE_EDIT_CONTENT:
            prompt_.render(canvas, palette, "EDIT NOTE");
            break;
        case MODE_CONFIRM_DELETE:
            renderConfirmDelete(canvas, palette);
            break;
    }
}

void ViewNotesScreen::renderEmpty(Canvas& canvas, const Palette& palette) const {
    canvas.fillScreen(palette.background);
    printCentered(canvas, "No notes yet", 45, 2, palette.foreground);
    printCentered(canvas, "Press ESC to go back", 70, 1, palette.foreground);
}

void ViewNotesScreen::renderList(Canvas& canvas, const Palette& palette) const {
    const std::vector<Note>& notes = ctx_->notes.list();
    const int count = static_cast<int>(notes.size());

    canvas.fillScreen(palette.background);
    printCentered(canvas, "YOUR NOTES", 3, 1, palette.foreground);

    int end = scroll_ + NOTES_VISIBLE_ROWS;
    if (end > count) end = count;

    for (int i = scroll_; i < end; ++i) {
        int16_t y = NOTE_LIST_TOP + (i - scroll_) * NOTE_ROW_HEIGHT;
        if (i == selected_) {
            canvas.drawText(5, y, ">", 1, palette.foreground);
        }

        char title[NOTE_ROW_CHARS + 1];
        truncateText(notes[i].title.c_str(), 25, title, sizeof(title));
        char row[48];
        snprintf(row, sizeof(row), "%d. %s", i + 1, title);
        canvas.drawText(15, y, row, 1, palette.foreground);
    }

    // Scroll indicators
    if (scroll_ > 0) {
        canvas.drawText(canvas.width() - 15, NOTE_LIST_TOP, "^", 1, palette.foreground);
    }
    if (end < count) {
        canvas.drawText(canvas.width() - 15, NOTE_LIST_TOP + (NOTES_VISIBLE_ROWS - 1) * NOTE_ROW_HEIGHT,
                        "v", 1, palette.foreground);
    }

    printFooter(canvas, "ENTER=View E=Edit X=Del ESC=Back", palette.foreground);
}

void ViewNotesScreen::renderViewer(Canvas& canvas, const Palette& palette) const {
    const Note* note = selectedNote();
    canvas.fillScreen(palette.background);
    if (note == nullptr) return;

    char title[NOTE_TITLE_CHARS + 1];
    truncateText(note->title.c_str(), NOTE_TITLE_CHARS, title, sizeof(title));
    canvas.drawText(5, 3, title, 1, palette.foreground);
    canvas.drawLine(0, 13, canvas.width() - 1, 13, palette.foreground);

    const int first = page_ * NOTE_VIEW_LINES_PER_PAGE;
    int16_t y = 18;
    for (int i = first; i < first + NOTE_VIEW_LINES_PER_PAGE && i < static_cast<int>(lines_.size()); ++i) {
        canvas.drawText(5, y, lines_[i].c_str(), 1, palette.foreground);
        y += NOTE_LINE_HEIGHT;
    }

    // More content past this page
    if (first + NOTE_VIEW_LINES_PER_PAGE < static_cast<int>(lines_.size())) {
        canvas.drawText(5, y, "...", 1, palette.foreground);
    }

    char footer[40];
    if (pageCount() > 1) {
        snprintf(footer, sizeof(footer), "ESC=Back UP/DN=Page %d/%d", page_ + 1, pageCount());
    } else {
        snprintf(footer, sizeof(footer), "ESC=Back");
    }
    printFooter(canvas, footer, palette.foreground);

    // Creation stamp shares the footer line when there is no page counter
    if (!note->created.empty() && pageCount() == 1) {
        const char* stamp = note->created.c_str();
        canvas.drawText(canvas.width() - textWidth(stamp, 1) - 5, canvas.height() - FONT_CHAR_HEIGHT - 4,
                        stamp, 1, palette.foreground);
    }
}

void ViewNotesScreen::renderConfirmDelete(Canvas& canvas, const Palette& palette) const {
    const Note* note = selectedNote();
    canvas.fillScreen(palette.background);
    printCentered(canvas, "Delete note?", 25, 2, palette.foreground);
    if (note != nullptr) {
        char title[NOTE_TITLE_CHARS + 1];
        truncateText(note->title.c_str(), NOTE_TITLE_CHARS, title, sizeof(title));
        printCentered(canvas, title, 55, 1, palette.foreground);
    }
    printFooter(canvas, "ENTER=Delete ESC=Cancel", palette.foreground);
}

// ---- Input ----

Transition ViewNotesScreen::handleKey(const KeyEvent& key) {
    switch (mode_) {
        case MODE_LIST:             return handleListKey(key);
        case MODE_VIEWER:           return handleViewerKey(key);
        case MODE_EDIT_TITLE:
        case MODE_EDIT_CONTENT:     return handleEditKey(key);
        case MODE_CONFIRM_DELETE:   return handleDeleteKey(key);
    }
    return Transition::stay();
}

Transition ViewNotesScreen::handleListKey(const KeyEvent& key) {
    const int count = static_cast<int>(ctx_->notes.count());

    if (key.code == KEYCODE_ESC) {
        return Transition::go(SCREEN_NOTES_MENU);
    }
    if (count == 0) {
        return Transition::stay();  // Empty list only answers to ESC
    }

    if (key.code == KEYCODE_ENTER) {
        openViewer();
        return Transition::redraw();
    }

    const Note* note = selectedNote();
    if (key.isChar('e') && note != nullptr) {
        edit_title_.clear();
        mode_ = MODE_EDIT_TITLE;
        prompt_.begin("Edit Title:", NOTE_TITLE_MAX_LEN, note->title.c_str());
        return Transition::redraw();
    }
    if (key.isChar('x') && note != nullptr) {
        mode_ = MODE_CONFIRM_DELETE;
        return Transition::redraw();
    }

    int previous = selected_;
    if (keyIsUp(key) && selected_ > 0) {
        selected_--;
    } else if (keyIsDown(key) && selected_ < count - 1) {
        selected_++;
    } else if (key.isDigit() && key.digit() >= 1 && key.digit() <= count) {
        selected_ = key.digit() - 1;
    }

    if (selected_ == previous) {
        return Transition::stay();
    }
    scrollIntoView(selected_, NOTES_VISIBLE_ROWS, scroll_);
    return Transition::redraw();
}

Transition ViewNotesScreen::handleViewerKey(const KeyEvent& key) {
    if (key.code == KEYCODE_ESC) {
        mode_ = MODE_LIST;
        lines_.clear();
        return Transition::redraw();
    }
    if (keyIsUp(key) && page_ > 0) {
        page_--;
        return Transition::redraw();
    }
    if (keyIsDown(key) && page_ < pageCount() - 1) {
        page_++;
        return Transition::redraw();
    }
    return Transition::stay();
}

Transition ViewNotesScreen::handleEditKey(const KeyEvent& key) {
    PromptResult result = prompt_.feed(key);
    if (result == PROMPT_EDITING) {
        return Transition::redraw();
    }
    if (result == PROMPT_ABORTED) {
        mode_ = MODE_LIST;
        return Transition::redraw();
    }

    const Note* note = selectedNote();
    if (note == nullptr) {
        mode_ = MODE_LIST;
        return Transition::redraw();
    }

    if (mode_ == MODE_EDIT_TITLE) {
        edit_title_ = prompt_.value();
        mode_ = MODE_EDIT_CONTENT;
        prompt_.begin("Edit Content:", NOTE_CONTENT_MAX_LEN, note->content.c_str());
        return Transition::redraw();
    }

    bool ok = ctx_->notes.update(note->id, edit_title_, prompt_.value()) && ctx_->notes.lastSaveOk();
    mode_ = MODE_LIST;
    overlay_.start(ctx_->clock.millis(), UI_NOTE_SAVED_MS, ok ? "Note Saved!" : "Save Failed", "");
    return Transition::redraw();
}

Transition ViewNotesScreen::handleDeleteKey(const KeyEvent& key) {
    if (key.code == KEYCODE_ESC) {
        mode_ = MODE_LIST;
        return Transition::redraw();
    }
    if (key.code != KEYCODE_ENTER) {
        return Transition::stay();
    }

    const Note* note = selectedNote();
    if (note != nullptr) {
        ctx_->notes.remove(note->id);
    }

    const int count = static_cast<int>(ctx_->notes.count());
    if (selected_ >= count) selected_ = count > 0 ? count - 1 : 0;
    // Keep the window full when rows below it were removed
    if (scroll_ > count - NOTES_VISIBLE_ROWS) {
        scroll_ = count > NOTES_VISIBLE_ROWS ? count - NOTES_VISIBLE_ROWS : 0;
    }
    scrollIntoView(selected_, NOTES_VISIBLE_ROWS, scroll_);

    mode_ = MODE_LIST;
    overlay_.start(ctx_->clock.millis(), UI_NOTE_SAVED_MS, "Note Deleted", "");
    return Transition::redraw();
}

Transition ViewNotesScreen::tick(uint32_t now_ms) {
    if (overlay_.expired(now_ms)) {
        overlay_.clear();
        return Transition::redraw();
    }
    return Transition::stay();
}
