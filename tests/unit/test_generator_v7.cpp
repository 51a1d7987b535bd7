#include <catch2/catch_test_macros.hpp>
#include "core/bit_packer.hpp"
#include "generation/generator.hpp"

#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

using namespace chronoid;
using namespace chronoid::generation;
using namespace std::chrono_literals;

namespace {

constexpr auto START = 1'700'000'000'000'000'000ns;
constexpr uint64_t START_MS = 1'700'000'000'000;

uint64_t counter_of(const Uuid& u) {
    return layout::unpack_v7(u.int_value()).counter;
}

// Message handler that reads the generator back while a log line is emitted.
Generator* reentrant_target = nullptr;
std::optional<GeneratorState> state_seen_from_handler;
std::string logged;

void reentrant_handler(QtMsgType, const QMessageLogContext&, const QString& message) {
    logged += message.toStdString() + '\n';
    if (reentrant_target) {
        state_seen_from_handler = reentrant_target->state();
    }
}

} // namespace

TEST_CASE("v7 carries version 7 and the RFC variant", "[generator][v7]") {
    Generator generator;
    const auto u = generator.generate_v7();

    REQUIRE(u.version() == 7);
    REQUIRE(u.variant() == Variant::Rfc4122);
    REQUIRE(NIL < u);
    REQUIRE(u < MAX);
}

TEST_CASE("v7 timestamp lies between surrounding clock reads", "[generator][v7]") {
    Generator generator;
    const auto before = system_clock()->unix_millis();
    const auto u = generator.generate_v7();
    const auto after = system_clock()->unix_millis();

    REQUIRE(u.time() >= before);
    REQUIRE(u.time() <= after);
    REQUIRE(static_cast<uint64_t>(u.timestamp()->millis()) == u.time());
}

TEST_CASE("v7 values sort in generation order", "[generator][v7]") {
    Generator generator;
    std::vector<Uuid> issued;
    issued.reserve(1000);
    for (int i = 0; i < 1000; ++i) {
        issued.push_back(generator.generate_v7());
    }

    auto sorted = issued;
    std::sort(sorted.begin(), sorted.end());
    REQUIRE(sorted == issued);

    const std::unordered_set<Uuid> unique(issued.begin(), issued.end());
    REQUIRE(unique.size() == issued.size());
}

TEST_CASE("v7 counter increments within a frozen millisecond", "[generator][v7]") {
    auto clock = std::make_shared<ManualClock>(START);
    Generator generator(clock);

    auto previous = generator.generate_v7();
    REQUIRE(previous.time() == START_MS);
    for (int i = 0; i < 100; ++i) {
        const auto next = generator.generate_v7();
        REQUIRE(previous < next);
        REQUIRE(next.time() == START_MS);
        REQUIRE(counter_of(next) == counter_of(previous) + 1);
        previous = next;
    }
}

TEST_CASE("v7 reseeds the counter on a new millisecond", "[generator][v7]") {
    auto clock = std::make_shared<ManualClock>(START);
    Generator generator(clock);

    const auto first = generator.generate_v7();
    clock->advance(1ms);
    const auto second = generator.generate_v7();

    REQUIRE(first < second);
    REQUIRE(second.time() == START_MS + 1);
    // Seeds leave the top counter bit clear.
    REQUIRE(counter_of(first) <= (layout::MAX_COUNTER_V7 >> 1));
    REQUIRE(counter_of(second) <= (layout::MAX_COUNTER_V7 >> 1));
    REQUIRE(generator.state().last_counter_v7 == counter_of(second));
}

TEST_CASE("v7 counter overflow advances the timestamp", "[generator][v7]") {
    auto clock = std::make_shared<ManualClock>(START);
    Generator generator(clock);

    GeneratorState state;
    state.last_timestamp_v7 = START_MS;
    state.last_counter_v7 = layout::MAX_COUNTER_V7;
    generator.restore(state);
    const auto saturated = Uuid(layout::pack_v7({.unix_ms = START_MS, .counter = layout::MAX_COUNTER_V7, .tail = ~uint32_t{0}}));

    const auto u = generator.generate_v7();
    REQUIRE(u.time() == START_MS + 1);
    REQUIRE(counter_of(u) < layout::MAX_COUNTER_V7);
    REQUIRE(saturated < u);
    REQUIRE(generator.state().last_timestamp_v7 == START_MS + 1);
}

TEST_CASE("v7 holds the stored timestamp when the clock is behind", "[generator][v7]") {
    auto clock = std::make_shared<ManualClock>(START);
    Generator generator(clock);

    SECTION("stored timestamp ahead of the clock") {
        GeneratorState state;
        state.last_timestamp_v7 = START_MS + 1000;
        state.last_counter_v7 = 5;
        generator.restore(state);

        const auto u = generator.generate_v7();
        REQUIRE(u.time() >= START_MS + 1000);
        REQUIRE(counter_of(u) == 6);
    }

    SECTION("clock stepped backwards between calls") {
        const auto before = generator.generate_v7();
        clock->advance(-5s);
        const auto after = generator.generate_v7();
        clock->advance(-5s);
        const auto later = generator.generate_v7();

        REQUIRE(before < after);
        REQUIRE(after < later);
        REQUIRE(after.time() == before.time());
        REQUIRE(later.time() == before.time());
    }
}

TEST_CASE("v7 state round-trips through restore", "[generator][v7]") {
    auto clock = std::make_shared<ManualClock>(START);
    Generator generator(clock);
    (void)generator.generate_v7();

    const auto saved = generator.state();
    REQUIRE(saved.last_timestamp_v7 == START_MS);

    Generator other(clock);
    other.restore(saved);
    REQUIRE(other.state() == saved);

    const auto next = other.generate_v7();
    REQUIRE(counter_of(next) == saved.last_counter_v7 + 1);
}

TEST_CASE("v7 logs the clock regression after releasing its lock", "[generator][v7][logging]") {
    auto clock = std::make_shared<ManualClock>(START);
    Generator generator(clock);

    GeneratorState state;
    state.last_timestamp_v7 = START_MS + 1000;
    state.last_counter_v7 = 5;
    generator.restore(state);

    reentrant_target = &generator;
    state_seen_from_handler.reset();
    logged.clear();
    QLoggingCategory::setFilterRules(QStringLiteral("chronoid.generator.debug=true"));
    const auto previous = qInstallMessageHandler(reentrant_handler);

    const auto u = generator.generate_v7();

    qInstallMessageHandler(previous);
    QLoggingCategory::setFilterRules(QString());
    reentrant_target = nullptr;

    REQUIRE(logged.find("behind") != std::string::npos);
    REQUIRE(state_seen_from_handler.has_value());
    REQUIRE(state_seen_from_handler->last_timestamp_v7 == START_MS + 1000);
    REQUIRE(state_seen_from_handler->last_counter_v7 == 6);
    REQUIRE(u.time() == START_MS + 1000);
}

TEST_CASE("v7 timestamp register wraps at the 48-bit limit", "[generator][v7]") {
    auto clock = std::make_shared<ManualClock>(START);
    Generator generator(clock);
    const uint64_t last_ms = 0xFFFF'FFFF'FFFF;

    GeneratorState state;
    state.last_timestamp_v7 = last_ms;
    state.last_counter_v7 = layout::MAX_COUNTER_V7;
    generator.restore(state);

    const auto u = generator.generate_v7();
    REQUIRE(u.time() == 0);
    REQUIRE(generator.state().last_timestamp_v7 == 0);
    REQUIRE(counter_of(u) <= (layout::MAX_COUNTER_V7 >> 1));

    SECTION("and resumes from the clock afterwards") {
        const auto next = generator.generate_v7();
        REQUIRE(next.time() == START_MS);
        REQUIRE(u < next);
    }
}
