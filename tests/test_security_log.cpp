#include <catch2/catch_test_macros.hpp>
#include "audit/event_persister.hpp"
#include "audit/jsonl_file_sink.hpp"
#include "audit/security_log.hpp"
#include "mocks/mock_event_sink.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace personaguard;
using personaguard::testing::MockEventSink;

namespace {

std::vector<nlohmann::json> parse_lines(const std::string& contents) {
    std::vector<nlohmann::json> out;
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

} // anonymous namespace

TEST_CASE("SecurityLog: append fills id and timestamp", "[security_log]") {
    SecurityLog log;
    log.record(SecurityEventType::PATH_VIOLATION, Severity::HIGH, "PathGuard", "Escape attempt",
               {{"root", "/data"}});

    auto events = log.recent_events(10);
    REQUIRE(events.size() == 1);
    CHECK_FALSE(events[0].id.empty());
    CHECK(events[0].timestamp != std::chrono::system_clock::time_point{});
    CHECK(events[0].type == SecurityEventType::PATH_VIOLATION);
    CHECK(events[0].source == "PathGuard");
    CHECK(events[0].metadata.at("root") == "/data");

    SECTION("Caller-supplied id is kept") {
        SecurityEvent event;
        event.id = "fixed-id";
        log.append(event);
        CHECK(log.recent_events(1)[0].id == "fixed-id");
    }
}

TEST_CASE("SecurityLog: details and metadata are scrubbed", "[security_log]") {
    SecurityLog log;
    const std::string token = "ghp_" + std::string(36, 'Z');
    log.record(SecurityEventType::TOKEN_VALIDATION_FAILURE, Severity::HIGH, "CredentialGuard",
               "Remote said: bad credentials for " + token,
               {{"header", "Authorization: Bearer " + token}, {"plain", "value"}});

    const auto event = log.recent_events(1).at(0);
    CHECK(event.details.find(token) == std::string::npos);
    CHECK(event.details.find("[REDACTED]") != std::string::npos);
    CHECK(event.metadata.at("header").find(token) == std::string::npos);
    CHECK(event.metadata.at("plain") == "value");
}

TEST_CASE("SecurityLog: bounded ring", "[security_log]") {
    SecurityLog log(SecurityLog::Config{3});
    CHECK(log.capacity() == 3);

    for (int i = 0; i < 5; ++i) {
        log.record(SecurityEventType::INPUT_REJECTED, Severity::LOW, "InputValidator",
                   "event " + std::to_string(i));
    }

    CHECK(log.size() == 3);
    auto events = log.recent_events(10);
    REQUIRE(events.size() == 3);
    CHECK(events[0].details == "event 2");
    CHECK(events[2].details == "event 4");

    auto last_two = log.recent_events(2);
    REQUIRE(last_two.size() == 2);
    CHECK(last_two[0].details == "event 3");

    const auto stats = log.stats();
    CHECK(stats.total_appended == 5);
    CHECK(stats.evicted == 2);
    CHECK(stats.by_severity[static_cast<size_t>(Severity::LOW)] == 5);

    SECTION("Clear empties the buffer but keeps counters") {
        log.clear();
        CHECK(log.size() == 0);
        CHECK(log.recent_events(10).empty());
        CHECK(log.stats().total_appended == 5);
    }

    SECTION("Zero capacity is raised to one") {
        SecurityLog tiny(SecurityLog::Config{0});
        CHECK(tiny.capacity() == 1);
        tiny.record(SecurityEventType::CONTENT_ACCEPTED, Severity::NONE, "ContentValidator", "a");
        tiny.record(SecurityEventType::CONTENT_ACCEPTED, Severity::NONE, "ContentValidator", "b");
        CHECK(tiny.recent_events(5).at(0).details == "b");
    }
}

TEST_CASE("SecurityLog: filters", "[security_log]") {
    SecurityLog log;
    log.record(SecurityEventType::PATH_VIOLATION, Severity::HIGH, "PathGuard", "a");
    log.record(SecurityEventType::CONTENT_SANITIZED, Severity::MEDIUM, "ContentValidator", "b");
    log.record(SecurityEventType::PATH_VIOLATION, Severity::MEDIUM, "PathGuard", "c");

    CHECK(log.events_by_type(SecurityEventType::PATH_VIOLATION).size() == 2);
    CHECK(log.events_by_type(SecurityEventType::AUDIT_FINDING).empty());

    auto medium = log.events_by_severity(Severity::MEDIUM);
    REQUIRE(medium.size() == 2);
    CHECK(medium[0].details == "b");
    CHECK(medium[1].details == "c");
}

TEST_CASE("SecurityLog: concurrent appends", "[security_log]") {
    SecurityLog log(SecurityLog::Config{100});

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log] {
            for (int i = 0; i < 250; ++i) {
                log.record(SecurityEventType::CONTENT_ACCEPTED, Severity::NONE, "ContentValidator", "x");
            }
        });
    }
    for (auto& th : threads) th.join();

    const auto stats = log.stats();
    CHECK(stats.total_appended == 1000);
    CHECK(stats.evicted == 900);
    CHECK(log.size() == 100);
}

TEST_CASE("SecurityLog: JSON line form", "[security_log]") {
    SecurityEvent event;
    event.id = "e1";
    event.type = SecurityEventType::YAML_REJECTED;
    event.severity = Severity::HIGH;
    event.source = "SecureStructuredParser";
    event.details = "Forbidden YAML tag";
    event.metadata = {{"field", "payload"}};

    const auto j = nlohmann::json::parse(to_json_line(event));
    CHECK(j["id"] == "e1");
    CHECK(j["type"] == "YAML_REJECTED");
    CHECK(j["severity"] == "high");
    CHECK(j["source"] == "SecureStructuredParser");
    CHECK(j["metadata"]["field"] == "payload");
    CHECK(std::string(security_event_type_to_string(SecurityEventType::AUDIT_FINDING)) == "AUDIT_FINDING");

    SECTION("Invalid UTF-8 does not throw") {
        event.details = std::string("bad ") + std::string(1, '\xFF');
        CHECK_NOTHROW(nlohmann::json::parse(to_json_line(event)));
    }
}

TEST_CASE("SecurityLog: persistence through EventPersister", "[security_log]") {
    auto state = std::make_shared<MockEventSink::State>();

    {
        auto persister = std::make_unique<EventPersister>(std::make_unique<MockEventSink>(state));
        SecurityLog log(SecurityLog::Config{10}, std::move(persister));

        log.record(SecurityEventType::COMMAND_REJECTED, Severity::HIGH, "CommandGuard", "first");
        log.record(SecurityEventType::COMMAND_REJECTED, Severity::HIGH, "CommandGuard",
                   "Bearer abcdef123456");
        log.flush();

        const auto lines = parse_lines(state->contents());
        REQUIRE(lines.size() == 2);
        CHECK(lines[0]["details"] == "first");
        CHECK(lines[1]["details"] == "Bearer [REDACTED]");
        CHECK(state->flushes.load() >= 1);
        CHECK(log.stats().persist_dropped == 0);
    }

    CHECK(state->shut_down.load());
}

TEST_CASE("EventPersister: sink failures are counted", "[security_log]") {
    auto state = std::make_shared<MockEventSink::State>();
    state->fail_writes = true;

    EventPersister persister(std::make_unique<MockEventSink>(state));
    SecurityEvent event;
    event.details = "lost";
    persister.enqueue(event);
    persister.flush();

    const auto stats = persister.stats();
    CHECK(stats.enqueued == 1);
    CHECK(stats.sink_failures == 1);
    CHECK(state->contents().empty());

    SECTION("Enqueue after shutdown is ignored") {
        persister.shutdown();
        persister.enqueue(event);
        CHECK(persister.stats().enqueued == 1);
    }
}

TEST_CASE("JsonlFileSink: append and rotate", "[security_log]") {
    testing::TempDir dir;
    const auto path = (dir.path() / "events.jsonl").string();

    JsonlFileSink::Config cfg;
    cfg.path = path;
    cfg.max_file_size_bytes = 32;

    {
        JsonlFileSink sink(cfg);
        CHECK(sink.name() == "jsonl:" + path);
        CHECK(sink.write("{\"n\":1,\"pad\":\"aaaaaaaaaaaa\"}\n"));
        CHECK(sink.write("{\"n\":2}\n"));
        sink.flush();
    }

    CHECK(dir.read("events.jsonl.1").find("\"n\":1") != std::string::npos);
    CHECK(dir.read("events.jsonl") == "{\"n\":2}\n");

    SECTION("Unwritable path throws on construction") {
        JsonlFileSink::Config bad;
        bad.path = (dir.path() / "missing-dir" / "events.jsonl").string();
        CHECK_THROWS_AS(JsonlFileSink(bad), std::runtime_error);
    }
}
