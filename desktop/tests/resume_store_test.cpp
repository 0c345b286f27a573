#include "resume_store.h"
#include "logger.h"
#include "test_support.h"

#include <filesystem>
#include <fstream>
#include <iostream>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace fs = std::filesystem;

static ResumeCheckpoint sample(const std::string& id) {
    ResumeCheckpoint cp;
    cp.transfer_id = id;
    cp.file_name = "movie.mkv";
    cp.total_size = 1000;
    cp.hash = std::string(64, 'c');
    cp.part_path = "/data/in/movie.mkv." + id + ".part";
    cp.ranges = {{0, 500, 200}, {500, 500, 500}};
    return cp;
}

static bool test_save_and_load(const fs::path& dir) {
    ResumeStore store(dir.string());
    TEST_ASSERT(store.directory() == (dir / ".nodelink").string(), "hidden directory under receive dir");
    TEST_ASSERT(store.path_for("abc") == (dir / ".nodelink" / "abc.checkpoint").string(), "file name");

    TEST_ASSERT(store.save(sample("abc")), "save");
    TEST_ASSERT(fs::exists(store.path_for("abc")), "file exists");
    TEST_ASSERT(!fs::exists(store.path_for("abc") + ".tmp"), "temporary renamed away");

    auto cp = store.load("abc");
    TEST_ASSERT(cp.has_value(), "load");
    TEST_ASSERT(cp->file_name == "movie.mkv" && cp->total_size == 1000, "header fields");
    TEST_ASSERT(cp->ranges.size() == 2, "ranges");
    TEST_ASSERT(cp->ranges[0].contiguous == 200 && cp->ranges[1].contiguous == 500, "progress");

    auto updated = sample("abc");
    updated.ranges[0].contiguous = 450;
    TEST_ASSERT(store.save(updated), "overwrite");
    TEST_ASSERT(store.load("abc")->ranges[0].contiguous == 450, "overwrite visible");

    store.remove("abc");
    TEST_ASSERT(!store.load("abc").has_value(), "removed");
    store.remove("abc");
    return true;
}

static bool test_rejects_bad_input(const fs::path& dir) {
    ResumeStore store(dir.string());
    TEST_ASSERT(!store.save(sample("../escape")), "path characters in id refused");
    TEST_ASSERT(!store.save(sample("")), "empty id refused");
    TEST_ASSERT(!store.load("../escape").has_value(), "bad id never loads");

    fs::create_directories(store.directory());
    {
        std::ofstream(store.path_for("corrupt")) << "{\"transfer_id\": \"corrupt\", \"ranges\": [";
    }
    TEST_ASSERT(!store.load("corrupt").has_value(), "truncated json ignored");

    auto no_ranges = sample("empty");
    no_ranges.ranges.clear();
    TEST_ASSERT(store.save(no_ranges), "saved without ranges");
    TEST_ASSERT(!store.load("empty").has_value(), "checkpoint without ranges ignored");

    auto wrong = sample("other");
    TEST_ASSERT(store.save(wrong), "save other");
    fs::copy_file(store.path_for("other"), store.path_for("renamed"));
    TEST_ASSERT(!store.load("renamed").has_value(), "id inside file must match");

    auto over = sample("over");
    over.ranges[0].contiguous = 9999;
    TEST_ASSERT(store.save(over), "save overlong progress");
    TEST_ASSERT(store.load("over")->ranges[0].contiguous == 500, "progress clamped to range length");
    return true;
}

static bool test_load_all(const fs::path& dir) {
    ResumeStore store(dir.string());
    TEST_ASSERT(store.load_all().empty(), "missing directory is empty");

    TEST_ASSERT(store.save(sample("one")) && store.save(sample("two")), "two saved");
    {
        std::ofstream(store.path_for("bad")) << "garbage";
        std::ofstream(fs::path(store.directory()) / "notes.txt") << "not a checkpoint";
    }
    const auto all = store.load_all();
    TEST_ASSERT(all.size() == 2, "only valid checkpoints listed");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    const auto workdir = test_support::make_workdir("resume_store");
    std::cout << "--- ResumeStore tests (" << workdir << ") ---" << std::endl;

    if (test_save_and_load(workdir / "a")) std::cout << "PASS: save and load" << std::endl;
    if (test_rejects_bad_input(workdir / "b")) std::cout << "PASS: bad input" << std::endl;
    if (test_load_all(workdir / "c")) std::cout << "PASS: load all" << std::endl;

    std::error_code ec;
    fs::remove_all(workdir, ec);

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
