// Notes store: ids, persistence and recovery from bad files

#include <gtest/gtest.h>
#include "config.h"
#include "notes_store.h"
#include "support/fakes.h"

class NotesStoreTest : public ::testing::Test {
protected:
    NotesStoreTest() : store(files, clock, NOTES_FILE_PATH) {}

    // Fresh store reading whatever is on "disk"
    std::vector<Note> reload() {
        NotesStore again(files, clock, NOTES_FILE_PATH);
        EXPECT_TRUE(again.load());
        return again.list();
    }

    static void expectSame(const std::vector<Note>& a, const std::vector<Note>& b) {
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(a[i].id, b[i].id);
            EXPECT_EQ(a[i].title, b[i].title);
            EXPECT_EQ(a[i].content, b[i].content);
            EXPECT_EQ(a[i].created, b[i].created);
        }
    }

    MemoryFileStore files;
    FakeClock clock;
    NotesStore store;
};

TEST_F(NotesStoreTest, CreateThenListReturnsSingleNote) {
    ASSERT_TRUE(store.load());
    Note created = store.create("Groceries", "Milk, eggs");

    const std::vector<Note>& notes = store.list();
    ASSERT_EQ(1u, notes.size());
    EXPECT_EQ(1, notes[0].id);
    EXPECT_EQ("Groceries", notes[0].title);
    EXPECT_EQ("Milk, eggs", notes[0].content);
    EXPECT_EQ("2026-01-05 09:41:00", notes[0].created);
    EXPECT_EQ(created.id, notes[0].id);
}

TEST_F(NotesStoreTest, DiskMatchesMemoryAfterEveryMutation) {
    store.create("One", "first");
    expectSame(store.list(), reload());

    store.create("Two", "second");
    expectSame(store.list(), reload());

    ASSERT_TRUE(store.update(1, "One (edited)", "first, revised"));
    expectSame(store.list(), reload());

    store.remove(2);
    expectSame(store.list(), reload());

    store.create("Three", "");
    expectSame(store.list(), reload());
}

TEST_F(NotesStoreTest, IdsStayUniqueAfterDeletes) {
    store.create("a", "");
    store.create("b", "");
    store.create("c", "");
    store.remove(2);

    Note next = store.create("d", "");
    EXPECT_EQ(4, next.id);

    store.remove(4);
    store.remove(3);
    EXPECT_EQ(2, store.create("e", "").id);
}

TEST_F(NotesStoreTest, GetAndUpdateMissingId) {
    store.create("only", "note");

    Note found;
    EXPECT_TRUE(store.get(1, found));
    EXPECT_EQ("only", found.title);
    EXPECT_FALSE(store.get(7, found));
    EXPECT_FALSE(store.update(7, "x", "y"));
    EXPECT_EQ("only", store.list()[0].title);
}

TEST_F(NotesStoreTest, RemoveMissingIdLeavesListUnchanged) {
    store.create("keep", "");
    store.remove(42);
    EXPECT_EQ(1u, store.count());
}

TEST_F(NotesStoreTest, MissingFileLoadsEmpty) {
    EXPECT_TRUE(store.load());
    EXPECT_EQ(0u, store.count());
}

TEST_F(NotesStoreTest, CorruptFileLoadsEmpty) {
    files.files[NOTES_FILE_PATH] = "[{\"id\": 1, \"title\": ";
    EXPECT_FALSE(store.load());
    EXPECT_EQ(0u, store.count());
}

TEST_F(NotesStoreTest, NonArrayFileLoadsEmpty) {
    files.files[NOTES_FILE_PATH] = "{\"id\": 1}";
    EXPECT_FALSE(store.load());
    EXPECT_EQ(0u, store.count());
}

TEST_F(NotesStoreTest, LoadsExistingFileInOrder) {
    files.files[NOTES_FILE_PATH] =
        "[{\"id\": 3, \"title\": \"Later\", \"content\": \"b\", \"created\": \"2025-12-01 10:00:00\"},"
        " {\"id\": 1, \"title\": \"Earlier\", \"content\": \"a\", \"created\": \"2025-11-01 10:00:00\"}]";
    ASSERT_TRUE(store.load());
    ASSERT_EQ(2u, store.count());
    EXPECT_EQ(3, store.list()[0].id);
    EXPECT_EQ("Earlier", store.list()[1].title);
    EXPECT_EQ(4, store.create("next", "").id);
}

TEST_F(NotesStoreTest, FileIsPrettyJsonArray) {
    store.create("Groceries", "Milk, eggs");
    const std::string& text = files.files[NOTES_FILE_PATH];
    ASSERT_FALSE(text.empty());
    EXPECT_EQ('[', text[0]);
    EXPECT_NE(std::string::npos, text.find("\"title\": \"Groceries\""));
    EXPECT_NE(std::string::npos, text.find('\n'));
}

TEST_F(NotesStoreTest, WriteFailureKeepsMemoryState) {
    files.fail_writes = true;
    store.create("unsaved", "");
    EXPECT_FALSE(store.lastSaveOk());
    EXPECT_EQ(1u, store.count());
    EXPECT_FALSE(files.exists(NOTES_FILE_PATH));

    files.fail_writes = false;
    store.create("saved", "");
    EXPECT_TRUE(store.lastSaveOk());
    EXPECT_EQ(2u, reload().size());
}

TEST_F(NotesStoreTest, UnsetClockLeavesTimestampEmpty) {
    clock.unset();
    Note note = store.create("no time", "");
    EXPECT_TRUE(note.created.empty());
}

TEST_F(NotesStoreTest, ClearRemovesEverything) {
    store.create("a", "");
    store.create("b", "");
    store.clear();
    EXPECT_EQ(0u, store.count());
    EXPECT_TRUE(reload().empty());
}
