#include <catch2/catch_test_macros.hpp>
#include "hostmon/process_ranker.hpp"
#include "fake_collector.hpp"

namespace {

const char* kHeader = "USER         PID %CPU %MEM    VSZ   RSS TTY      STAT START   TIME COMMAND";

std::string row(const std::string& user, int pid, const std::string& cpu, const std::string& mem,
                const std::string& rss_kb, const std::string& command) {
    return user + " " + std::to_string(pid) + " " + cpu + " " + mem + " 204800 " + rss_kb +
           " ? Ss 10:00 0:01 " + command;
}

} // namespace

TEST_CASE("parse_process_row reads ps aux columns", "[processes]") {
    SECTION("Sizes are reported in whole megabytes") {
        auto entry = hostmon::parse_process_row(
            "root 1 0.5 1.2 168000 12000 ? Ss 10:00 0:01 /sbin/init splash");
        REQUIRE(entry.has_value());
        REQUIRE(entry->user == "root");
        REQUIRE(entry->pid == 1);
        REQUIRE(entry->cpu_pct == 0.5);
        REQUIRE(entry->mem_pct == 1.2);
        REQUIRE(entry->vsz_mb == 164);
        REQUIRE(entry->rss_mb == 11);
        REQUIRE(entry->command == "/sbin/init splash");
    }

    SECTION("Missing columns or non-numeric fields are rejected") {
        REQUIRE_FALSE(hostmon::parse_process_row("root 1 0.5 1.2").has_value());
        REQUIRE_FALSE(hostmon::parse_process_row(kHeader).has_value());
    }

    SECTION("Row without a command gets a placeholder") {
        auto entry = hostmon::parse_process_row("root 2 0.0 0.0 0 0 ? S 10:00 0:00");
        REQUIRE(entry.has_value());
        REQUIRE(entry->command == hostmon::kNoCommand);
    }
}

TEST_CASE("Commands are truncated to the column width", "[processes]") {
    std::string exact(50, 'a');
    REQUIRE(hostmon::truncate_command(exact) == exact);

    std::string long_command(80, 'b');
    auto shown = hostmon::truncate_command(long_command);
    REQUIRE(shown.size() == 50);
    REQUIRE(shown == std::string(47, 'b') + "...");

    REQUIRE(hostmon::truncate_command("") == "<none>");
}

TEST_CASE("ProcessRanker keeps the top five in descending order", "[processes]") {
    std::vector<std::string> table = {
        kHeader,
        row("alice", 10, "1.0", "0.1", "1024", "idle-a"),
        row("bob", 11, "75.0", "2.0", "2048", "busy"),
        row("carol", 12, "30.0", "25.0", "4096", "moderate"),
        row("dave", 13, "5.0", "1.0", "1024", "small"),
        row("erin", 14, "12.5", "0.5", "1024", "medium"),
        row("frank", 15, "0.0", "0.0", "0", "sleeper"),
        row("grace", 16, "3.0", "0.2", "1024", "tiny"),
    };

    SECTION("By CPU") {
        auto top = hostmon::ProcessRanker::rank(table, hostmon::SortKey::Cpu);
        REQUIRE(top.size() == 5);
        REQUIRE(top[0].pid == 11);
        REQUIRE(top[1].pid == 12);
        REQUIRE(top[2].pid == 14);
        REQUIRE(top[3].pid == 13);
        REQUIRE(top[4].pid == 16);
        for (size_t i = 1; i < top.size(); ++i) {
            REQUIRE(top[i - 1].cpu_pct >= top[i].cpu_pct);
        }

        REQUIRE(top[0].highlight == hostmon::RowHighlight::Critical);
        REQUIRE(top[1].highlight == hostmon::RowHighlight::Elevated);
        REQUIRE(top[2].highlight == hostmon::RowHighlight::Normal);
    }

    SECTION("By memory") {
        auto top = hostmon::ProcessRanker::rank(table, hostmon::SortKey::Mem);
        REQUIRE(top.size() == 5);
        REQUIRE(top[0].pid == 12);
        REQUIRE(top[0].highlight == hostmon::RowHighlight::Elevated);
        REQUIRE(top[1].pid == 11);
        REQUIRE(top[1].highlight == hostmon::RowHighlight::Normal);
    }
}

TEST_CASE("ProcessRanker handles short process tables", "[processes]") {
    SECTION("Fewer than five rows") {
        std::vector<std::string> table = {
            kHeader,
            row("root", 1, "0.3", "0.1", "1024", "init"),
            row("root", 2, "0.9", "0.1", "1024", "kthreadd"),
        };
        auto top = hostmon::ProcessRanker::rank(table, hostmon::SortKey::Cpu);
        REQUIRE(top.size() == 2);
        REQUIRE(top[0].pid == 2);
    }

    SECTION("Header only") {
        REQUIRE(hostmon::ProcessRanker::rank({kHeader}, hostmon::SortKey::Cpu).empty());
    }

    SECTION("Unavailable process listing") {
        hostmon::testing::FakeCollector collector;
        hostmon::ProcessRanker ranker(collector);
        REQUIRE(ranker.top(hostmon::SortKey::Mem).empty());
        REQUIRE(collector.process_list_count == 1);
    }
}

TEST_CASE("Sort fields match ps", "[processes]") {
    REQUIRE(std::string(hostmon::sort_field(hostmon::SortKey::Cpu)) == "%cpu");
    REQUIRE(std::string(hostmon::sort_field(hostmon::SortKey::Mem)) == "%mem");
    REQUIRE(std::string(hostmon::sort_field(hostmon::SortKey::Rss)) == "rss");
}
