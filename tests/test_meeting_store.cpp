#include <catch2/catch_test_macros.hpp>

#include "storage/meeting_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        static int n = 0;
        path = fs::temp_directory_path() /
               ("meetcap_test_store_" + std::to_string(getpid()) + "_" + std::to_string(n++));
        fs::remove_all(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

int folders_containing(const MeetingStore& store, const std::string& meeting_id) {
    int n = 0;
    for (const auto& f : store.folders()) {
        n += static_cast<int>(std::ranges::count(f.meeting_ids, meeting_id));
    }
    return n;
}

bool sorted_by_updated_desc(const std::vector<MeetingSummary>& v) {
    return std::ranges::is_sorted(v, std::ranges::greater{}, &MeetingSummary::updated_at);
}

} // namespace

TEST_CASE("MeetingStore meetings", "[store]") {
    TmpDir dir;
    MeetingStore store(dir.path);

    SECTION("MissingIndexStartsEmpty") {
        REQUIRE(store.summaries().empty());
        REQUIRE(store.folders().empty());
    }

    SECTION("CreateWithBlankTitleUsesDefault") {
        auto m = store.create_meeting("   \t ");
        REQUIRE(m.title.starts_with("Meeting "));
        REQUIRE(m.status == MeetingStatus::Recording);
        REQUIRE_FALSE(m.ended_at.has_value());

        auto none = store.create_meeting();
        REQUIRE(none.title.starts_with("Meeting "));
    }

    SECTION("CreateTrimsTitle") {
        auto m = store.create_meeting("  Weekly sync  ");
        REQUIRE(m.title == "Weekly sync");
        REQUIRE(store.summaries().front().id == m.id);
        REQUIRE(store.meeting(m.id)->title == "Weekly sync");
    }

    SECTION("AppendAndFinish") {
        auto m = store.create_meeting("A");
        REQUIRE(store.append_utterance(Utterance::make(0, 0.0, 1.0, "one"), m.id));
        REQUIRE(store.append_utterance(Utterance::make(1, 1.0, 2.0, "two"), m.id));
        REQUIRE(store.finish_meeting(m.id));

        auto loaded = store.meeting(m.id);
        REQUIRE(loaded->utterances.size() == 2);
        REQUIRE(loaded->status == MeetingStatus::Completed);
        REQUIRE(loaded->ended_at.has_value());
        REQUIRE(store.summaries().front().utterance_count == 2);
        REQUIRE(store.summaries().front().updated_at == *loaded->ended_at);
    }

    SECTION("UnknownMeetingMutationsFail") {
        REQUIRE_FALSE(store.append_utterance(Utterance::make(0, 0, 1, "x"), "nope"));
        REQUIRE_FALSE(store.finish_meeting("nope"));
        REQUIRE_FALSE(store.mark_meeting_failed("nope"));
        REQUIRE_FALSE(store.rename_meeting("nope", "title"));
        REQUIRE_FALSE(store.meeting("nope").has_value());
    }

    SECTION("MarkFailed") {
        auto m = store.create_meeting("B");
        REQUIRE(store.mark_meeting_failed(m.id));
        REQUIRE(store.meeting(m.id)->status == MeetingStatus::Failed);
        REQUIRE(store.summaries().front().status == MeetingStatus::Failed);
    }

    SECTION("Rename") {
        auto m = store.create_meeting("Old");
        REQUIRE_FALSE(store.rename_meeting(m.id, "  "));
        REQUIRE(store.rename_meeting(m.id, " New "));
        REQUIRE(store.meeting(m.id)->title == "New");
        REQUIRE(store.summaries().front().title == "New");
    }

    SECTION("SummariesSortedByUpdatedAtDescending") {
        auto a = store.create_meeting("a");
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto b = store.create_meeting("b");
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto c = store.create_meeting("c");
        REQUIRE(sorted_by_updated_desc(store.summaries()));

        // Finishing a moves it to the front.
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        store.finish_meeting(a.id);
        REQUIRE(store.summaries().front().id == a.id);
        REQUIRE(sorted_by_updated_desc(store.summaries()));
    }

    SECTION("DeleteRemovesEverywhere") {
        auto m = store.create_meeting("gone");
        auto f = store.create_folder("F");
        REQUIRE(store.move_meeting(m.id, f->id));

        store.delete_meeting(m.id);
        store.flush();

        REQUIRE(store.summaries().empty());
        REQUIRE(store.folder(f->id)->meeting_ids.empty());
        REQUIRE_FALSE(store.meeting(m.id).has_value());
        REQUIRE_FALSE(fs::exists(store.meeting_path(m.id)));
    }

    SECTION("DeletedMeetingStaysGoneWhileRemovalPending") {
        auto m = store.create_meeting("gone");
        store.flush();
        auto body = fs::path(store.meeting_path(m.id));
        std::string saved;
        {
            std::ifstream in(body);
            saved.assign(std::istreambuf_iterator<char>(in), {});
        }

        store.delete_meeting(m.id);
        store.flush();
        // Put the body back as if the queued removal had not run yet.
        { std::ofstream(body) << saved; }

        REQUIRE_FALSE(store.meeting(m.id).has_value());
        REQUIRE_FALSE(store.rename_meeting(m.id, "back"));
        REQUIRE_FALSE(store.move_meeting(m.id, std::nullopt));
        REQUIRE_FALSE(store.finish_meeting(m.id));
        REQUIRE(store.summaries().empty());
    }

    SECTION("DeleteBehindBusyWriter") {
        auto m = store.create_meeting("gone");
        store.flush();
        for (int i = 0; i < 300; ++i) store.create_meeting("filler");

        store.delete_meeting(m.id);
        REQUIRE_FALSE(store.meeting(m.id).has_value());
        REQUIRE_FALSE(store.rename_meeting(m.id, "x"));

        store.flush();
        REQUIRE_FALSE(fs::exists(store.meeting_path(m.id)));
        REQUIRE(store.summaries().size() == 300);
    }

    SECTION("ChangeListenersNotified") {
        int changes = 0;
        store.subscribe([&] { ++changes; });
        auto m = store.create_meeting("x");
        store.rename_meeting(m.id, "y");
        REQUIRE(changes == 2);
    }
}

TEST_CASE("MeetingStore folders", "[store]") {
    TmpDir dir;
    MeetingStore store(dir.path);

    SECTION("CreateRejectsBlankNames") {
        REQUIRE_FALSE(store.create_folder("").has_value());
        REQUIRE_FALSE(store.create_folder("  \n").has_value());
        auto f = store.create_folder("  Clients ");
        REQUIRE(f.has_value());
        REQUIRE(f->name == "Clients");
        REQUIRE(store.folders().size() == 1);
    }

    SECTION("Rename") {
        auto f = store.create_folder("A");
        REQUIRE_FALSE(store.rename_folder(f->id, " "));
        REQUIRE_FALSE(store.rename_folder("missing", "B"));
        REQUIRE(store.rename_folder(f->id, " B "));
        REQUIRE(store.folder(f->id)->name == "B");
    }

    SECTION("MoveKeepsSingleMembership") {
        auto m = store.create_meeting("m");
        auto f1 = store.create_folder("one");
        auto f2 = store.create_folder("two");

        REQUIRE(store.move_meeting(m.id, f1->id));
        REQUIRE(store.move_meeting(m.id, f1->id));
        REQUIRE(store.folder(f1->id)->meeting_ids.size() == 1);

        REQUIRE(store.move_meeting(m.id, f2->id));
        REQUIRE(folders_containing(store, m.id) == 1);
        REQUIRE(store.folder(f2->id)->meeting_ids == std::vector<std::string>{m.id});
        REQUIRE(store.meeting(m.id)->folder_id == f2->id);

        REQUIRE(store.move_meeting(m.id, std::nullopt));
        REQUIRE(folders_containing(store, m.id) == 0);
        REQUIRE_FALSE(store.meeting(m.id)->folder_id.has_value());
    }

    SECTION("MoveToMissingFolderChangesNothing") {
        auto m = store.create_meeting("m");
        auto f = store.create_folder("one");
        REQUIRE(store.move_meeting(m.id, f->id));

        REQUIRE_FALSE(store.move_meeting(m.id, "no-such-folder"));
        REQUIRE(store.folder(f->id)->meeting_ids == std::vector<std::string>{m.id});
        REQUIRE(store.meeting(m.id)->folder_id == f->id);
    }

    SECTION("DeleteFolderUnassignsMembers") {
        auto a = store.create_meeting("a");
        auto b = store.create_meeting("b");
        auto f = store.create_folder("F");
        store.move_meeting(a.id, f->id);
        store.move_meeting(b.id, f->id);
        REQUIRE(store.unfiled_summaries().empty());

        REQUIRE(store.delete_folder(f->id));
        REQUIRE_FALSE(store.folder(f->id).has_value());
        REQUIRE(store.summaries().size() == 2);

        auto unfiled = store.unfiled_summaries();
        REQUIRE(unfiled.size() == 2);
        REQUIRE_FALSE(store.meeting(a.id)->folder_id.has_value());
        REQUIRE_FALSE(store.meeting(b.id)->folder_id.has_value());
        REQUIRE(sorted_by_updated_desc(unfiled));
    }

    SECTION("SummariesForFolderFollowMemberOrder") {
        auto a = store.create_meeting("a");
        auto b = store.create_meeting("b");
        auto f = store.create_folder("F");
        store.move_meeting(b.id, f->id);
        store.move_meeting(a.id, f->id);

        auto in_folder = store.summaries_for_folder(f->id);
        REQUIRE(in_folder.size() == 2);
        REQUIRE(in_folder[0].id == b.id);
        REQUIRE(in_folder[1].id == a.id);
        REQUIRE(store.summaries_for_folder("missing").empty());
    }

    SECTION("DeleteMissingFolder") {
        REQUIRE_FALSE(store.delete_folder("missing"));
    }
}

TEST_CASE("MeetingStore persistence", "[store]") {
    TmpDir dir;

    SECTION("ReloadFromDisk") {
        std::string id, folder_id;
        {
            MeetingStore store(dir.path);
            auto m = store.create_meeting("Persisted");
            id = m.id;
            store.append_utterance(Utterance::make(0, 0.0, 3.0, "kept"), id);
            store.finish_meeting(id);
            folder_id = store.create_folder("Archive")->id;
            store.move_meeting(id, folder_id);
            store.flush();
        }

        MeetingStore reloaded(dir.path);
        REQUIRE(reloaded.summaries().size() == 1);
        REQUIRE(reloaded.summaries()[0].title == "Persisted");
        REQUIRE(reloaded.summaries()[0].utterance_count == 1);
        REQUIRE(reloaded.folder(folder_id)->meeting_ids == std::vector<std::string>{id});

        auto m = reloaded.meeting(id);
        REQUIRE(m.has_value());
        REQUIRE(m->utterances[0].text == "kept");
        REQUIRE(m->status == MeetingStatus::Completed);
        REQUIRE(m->folder_id == folder_id);
    }

    SECTION("LayoutOnDisk") {
        MeetingStore store(dir.path);
        auto m = store.create_meeting("x");
        store.flush();

        REQUIRE(fs::exists(dir.path / "index.json"));
        REQUIRE(fs::exists(dir.path / "items" / (m.id + ".json")));

        std::ifstream f(dir.path / "index.json");
        auto j = json::parse(f);
        REQUIRE(j.contains("summaries"));
        REQUIRE(j.contains("folders"));
        REQUIRE(j["summaries"][0]["id"] == m.id);
    }

    SECTION("CorruptIndexStartsEmpty") {
        fs::create_directories(dir.path);
        { std::ofstream(dir.path / "index.json") << "{ this is not json"; }

        MeetingStore store(dir.path);
        REQUIRE(store.summaries().empty());
        REQUIRE(store.folders().empty());

        // Still usable afterwards.
        store.create_meeting("fresh");
        REQUIRE(store.summaries().size() == 1);
    }

    SECTION("ClearAllRemovesRoot") {
        MeetingStore store(dir.path);
        auto m = store.create_meeting("x");
        store.create_folder("F");
        store.flush();

        store.clear_all();
        store.flush();

        REQUIRE(store.summaries().empty());
        REQUIRE(store.folders().empty());
        REQUIRE_FALSE(store.meeting(m.id).has_value());
        REQUIRE_FALSE(fs::exists(dir.path));
    }

    SECTION("ClearedMeetingStaysGoneWhileRemovalPending") {
        MeetingStore store(dir.path);
        auto m = store.create_meeting("x");
        store.flush();
        std::string saved;
        {
            std::ifstream in(store.meeting_path(m.id));
            saved.assign(std::istreambuf_iterator<char>(in), {});
        }

        store.clear_all();
        store.flush();
        fs::create_directories(store.meeting_path(m.id).parent_path());
        { std::ofstream(store.meeting_path(m.id)) << saved; }

        REQUIRE_FALSE(store.meeting(m.id).has_value());
        REQUIRE_FALSE(store.rename_meeting(m.id, "back"));
        REQUIRE(store.summaries().empty());
    }
}
