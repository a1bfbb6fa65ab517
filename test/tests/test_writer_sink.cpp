#include <gtest/gtest.h>
#include "vital_log.hpp"
#include "utils/test_utils.hpp"
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

const std::runtime_error testErr("my test error");

const vital::CompletionStatus kAllStatuses[] = {
    vital::CompletionStatus::Success,
    vital::CompletionStatus::ValidationError,
    vital::CompletionStatus::Panic,
    vital::CompletionStatus::Error,
    vital::CompletionStatus::Junk
};

vital::Kvs watKvs() {
    return vital::Kvs{{"wat", "ok"}, {"another", "thing"}};
}

vital::Kvs watKvsWithLevel(vital::LogLevel level) {
    vital::Kvs kvs = watKvs();
    kvs["level"] = vital::getLevelString(level);
    return kvs;
}

template <typename...>
struct voider { typedef void type; };

// Whether emitEvent(job, event, <args>) resolves to exactly one overload.
template <typename S, typename = void>
struct AcceptsBracedMetadata : std::false_type {};

template <typename S>
struct AcceptsBracedMetadata<S, typename voider<decltype(
    std::declval<S &>().emitEvent(std::string(), std::string(), {}))>::type> : std::true_type {};

template <typename S, typename = void>
struct AcceptsEmptyKvs : std::false_type {};

template <typename S>
struct AcceptsEmptyKvs<S, typename voider<decltype(
    std::declval<S &>().emitEvent(std::string(), std::string(), vital::Kvs{}))>::type> : std::true_type {};

template <typename S, typename = void>
struct AcceptsBracedCompleteMetadata : std::false_type {};

template <typename S>
struct AcceptsBracedCompleteMetadata<S, typename voider<decltype(
    std::declval<S &>().emitComplete(std::string(), vital::CompletionStatus::Success,
                                     std::int64_t(0), {}))>::type> : std::true_type {};

// A bare {} would otherwise bind to the pointer overload and read as "no metadata".
static_assert(!AcceptsBracedMetadata<vital::WriterSink>::value,
              "emitEvent(job, event, {}) must not compile");
static_assert(!AcceptsBracedMetadata<vital::ISink>::value,
              "emitEvent(job, event, {}) must not compile");
static_assert(!AcceptsBracedCompleteMetadata<vital::WriterSink>::value,
              "emitComplete(job, status, nanos, {}) must not compile");
static_assert(AcceptsEmptyKvs<vital::WriterSink>::value,
              "emitEvent(job, event, Kvs{}) must compile");

} // namespace

class WriterSinkTest : public ::testing::Test {
protected:
    std::ostringstream b;

    std::string body() { return TestUtils::stripTimestamp(b.str()); }
};

// --- emitEvent ---

TEST_F(WriterSinkTest, EmitEventBasic) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitEvent("myjob", "myevent", nullptr);

    EXPECT_EQ(body(), "job:myjob event:myevent\n");
}

TEST_F(WriterSinkTest, EmitEventWithoutKvsArgument) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitEvent("myjob", "myevent");

    EXPECT_EQ(body(), "job:myjob event:myevent\n");
}

TEST_F(WriterSinkTest, EmitEventKvsWithFilteredLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    vital::Kvs kvs = {{"level", vital::getLevelString(vital::LogLevel::DEBUG)}};
    sink.emitEvent("myjob", "myevent", kvs);

    EXPECT_EQ(b.str().size(), 0u);
}

TEST_F(WriterSinkTest, EmitEventKvsWithIncludedLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    vital::Kvs kvs = {{"level", vital::getLevelString(vital::LogLevel::ERROR)}};
    sink.emitEvent("myjob", "myevent", kvs);

    EXPECT_EQ(body(), "job:myjob event:myevent kvs:[level:error]\n");
}

TEST_F(WriterSinkTest, EmitEventKvs) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitEvent("myjob", "myevent", watKvs());

    EXPECT_EQ(body(), "job:myjob event:myevent kvs:[another:thing wat:ok]\n");
}

TEST_F(WriterSinkTest, EmitEventEmptyKvs) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    vital::Kvs empty;
    sink.emitEvent("myjob", "myevent", empty);

    EXPECT_EQ(body(), "job:myjob event:myevent kvs:[]\n");
}

TEST_F(WriterSinkTest, EmitEventEmptyKvsTemporary) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitEvent("myjob", "myevent", vital::Kvs{});

    EXPECT_EQ(body(), "job:myjob event:myevent kvs:[]\n");
}

TEST_F(WriterSinkTest, EmitEventNullKvsPointer) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    const vital::Kvs *none = nullptr;
    sink.emitEvent("myjob", "myevent", none);

    EXPECT_EQ(body(), "job:myjob event:myevent\n");
}

TEST_F(WriterSinkTest, EmitEventKvsWithLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitEvent("myjob", "myevent", watKvsWithLevel(vital::LogLevel::INFO));

    EXPECT_EQ(body(), "job:myjob event:myevent kvs:[another:thing level:info wat:ok]\n");
}

TEST_F(WriterSinkTest, EmitEventKvsAndFilteredLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::ERROR);
    sink.emitEvent("myjob", "myevent", watKvsWithLevel(vital::LogLevel::INFO));

    EXPECT_EQ(b.str().size(), 0u);
}

// --- emitEventErr ---

TEST_F(WriterSinkTest, EmitEventErrBasic) {
    vital::WriterSink sink(b, vital::LogLevel::ERROR);
    sink.emitEventErr("myjob", "myevent", testErr, nullptr);

    EXPECT_EQ(body(), "job:myjob event:myevent err:my test error\n");
}

TEST_F(WriterSinkTest, EmitEventErrKvs) {
    vital::WriterSink sink(b, vital::LogLevel::ERROR);
    sink.emitEventErr("myjob", "myevent", testErr, watKvs());

    EXPECT_EQ(body(), "job:myjob event:myevent err:my test error kvs:[another:thing wat:ok]\n");
}

TEST_F(WriterSinkTest, EmitEventErrKvsWithLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitEventErr("myjob", "myevent", testErr, watKvsWithLevel(vital::LogLevel::INFO));

    EXPECT_EQ(body(),
              "job:myjob event:myevent err:my test error kvs:[another:thing level:info wat:ok]\n");
}

TEST_F(WriterSinkTest, EmitEventErrKvsAndFilteredLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::ERROR);
    sink.emitEventErr("myjob", "myevent", testErr, watKvsWithLevel(vital::LogLevel::INFO));

    EXPECT_EQ(b.str().size(), 0u);
}

TEST_F(WriterSinkTest, EmitEventErrUsesDerivedExceptionText) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    try {
        throw std::out_of_range("index 7 out of range");
    } catch (const std::exception &e) {
        sink.emitEventErr("myjob", "lookup", e);
    }

    EXPECT_EQ(body(), "job:myjob event:lookup err:index 7 out of range\n");
}

// --- emitTiming ---

TEST_F(WriterSinkTest, EmitTimingBasic) {
    vital::WriterSink sink(b, vital::LogLevel::TRACE);
    sink.emitTiming("myjob", "myevent", 1204000, nullptr);

    EXPECT_EQ(body(), "job:myjob event:myevent time:1204 \xCE\xBCs\n");
}

TEST_F(WriterSinkTest, EmitTimingKvs) {
    vital::WriterSink sink(b, vital::LogLevel::ERROR);
    sink.emitTiming("myjob", "myevent", 34567890, watKvs());

    EXPECT_EQ(body(), "job:myjob event:myevent time:34 ms kvs:[another:thing wat:ok]\n");
}

TEST_F(WriterSinkTest, EmitTimingKvsWithLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitTiming("myjob", "myevent", 34567890, watKvsWithLevel(vital::LogLevel::INFO));

    EXPECT_EQ(body(), "job:myjob event:myevent time:34 ms kvs:[another:thing level:info wat:ok]\n");
}

TEST_F(WriterSinkTest, EmitTimingKvsAndFilteredLogLevel) {
    vital::WriterSink sink(b, vital::LogLevel::ERROR);
    sink.emitTiming("myjob", "myevent", 34567890, watKvsWithLevel(vital::LogLevel::INFO));

    EXPECT_EQ(b.str().size(), 0u);
}

TEST_F(WriterSinkTest, EmitTimingNanoseconds) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitTiming("myjob", "myevent", 500);

    EXPECT_EQ(body(), "job:myjob event:myevent time:500 ns\n");
}

// --- emitComplete ---

TEST_F(WriterSinkTest, EmitCompleteBasic) {
    for (vital::CompletionStatus status : kAllStatuses) {
        std::ostringstream out;
        vital::WriterSink sink(out, vital::LogLevel::ERROR);
        sink.emitComplete("myjob", status, 1204000, nullptr);

        EXPECT_EQ(TestUtils::stripTimestamp(out.str()),
                  std::string("job:myjob status:") + vital::getCompletionStatusString(status) +
                  " time:1204 \xCE\xBCs\n");
    }
}

TEST_F(WriterSinkTest, EmitCompleteKvs) {
    for (vital::CompletionStatus status : kAllStatuses) {
        std::ostringstream out;
        vital::WriterSink sink(out, vital::LogLevel::ERROR);
        sink.emitComplete("myjob", status, 34567890, watKvs());

        EXPECT_EQ(TestUtils::stripTimestamp(out.str()),
                  std::string("job:myjob status:") + vital::getCompletionStatusString(status) +
                  " time:34 ms kvs:[another:thing wat:ok]\n");
    }
}

TEST_F(WriterSinkTest, EmitCompleteKvsWithLogLevel) {
    for (vital::CompletionStatus status : kAllStatuses) {
        std::ostringstream out;
        vital::WriterSink sink(out, vital::LogLevel::INFO);
        sink.emitComplete("myjob", status, 34567890, watKvsWithLevel(vital::LogLevel::INFO));

        EXPECT_EQ(TestUtils::stripTimestamp(out.str()),
                  std::string("job:myjob status:") + vital::getCompletionStatusString(status) +
                  " time:34 ms kvs:[another:thing level:info wat:ok]\n");
    }
}

TEST_F(WriterSinkTest, EmitCompleteKvsAndFilteredLogLevel) {
    for (vital::CompletionStatus status : kAllStatuses) {
        std::ostringstream out;
        vital::WriterSink sink(out, vital::LogLevel::ERROR);
        sink.emitComplete("myjob", status, 34567890, watKvsWithLevel(vital::LogLevel::INFO));

        EXPECT_EQ(out.str().size(), 0u);
    }
}

TEST_F(WriterSinkTest, EmitCompleteSuccessExample) {
    vital::WriterSink sink(b, vital::LogLevel::INFO);
    sink.emitComplete("myjob", vital::CompletionStatus::Success, 34567890, watKvs());

    EXPECT_EQ(body(), "job:myjob status:success time:34 ms kvs:[another:thing wat:ok]\n");
}

// --- write behavior ---

TEST_F(WriterSinkTest, EachEmissionIsOneWrite) {
    auto transportOwner = vital::detail::make_unique<RecordingTransport>();
    RecordingTransport *transport = transportOwner.get();
    vital::WriterSink sink{std::move(transportOwner), vital::LogLevel::TRACE};

    sink.emitEvent("j", "a", watKvs());
    sink.emitEventErr("j", "b", testErr);
    sink.emitTiming("j", "c", 3000);
    sink.emitComplete("j", vital::CompletionStatus::Panic, 10);

    std::vector<std::string> writes = transport->writes();
    ASSERT_EQ(writes.size(), 4u);
    for (const auto &w : writes) {
        ASSERT_FALSE(w.empty());
        EXPECT_EQ(w.back(), '\n');
        EXPECT_EQ(w.find('\n'), w.size() - 1) << w;
    }
    EXPECT_EQ(TestUtils::stripTimestamp(writes[3]), "job:j status:panic time:10 ns\n");
}

TEST_F(WriterSinkTest, SuccessiveLinesAppearInCallOrder) {
    vital::WriterSink sink(b, vital::LogLevel::TRACE);
    for (int i = 0; i < 5; ++i) {
        sink.emitEvent("myjob", "event" + std::to_string(i));
    }

    std::vector<std::string> lines = TestUtils::splitLines(b.str());
    ASSERT_EQ(lines.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(TestUtils::stripTimestamp(lines[i]), "job:myjob event:event" + std::to_string(i));
    }
}

TEST_F(WriterSinkTest, TimestampIsComputedPerCall) {
    vital::WriterSink sink(b, vital::LogLevel::TRACE);
    sink.emitEvent("myjob", "first");
    sink.emitEvent("myjob", "second");

    std::vector<std::string> lines = TestUtils::splitLines(b.str());
    ASSERT_EQ(lines.size(), 2u);
    std::string ts1 = lines[0].substr(1, lines[0].find(']') - 1);
    std::string ts2 = lines[1].substr(1, lines[1].find(']') - 1);
    EXPECT_LE(ts1, ts2);
}

TEST_F(WriterSinkTest, LevelKeyIsNotStrippedFromOutput) {
    vital::WriterSink sink(b, vital::LogLevel::TRACE);
    vital::Kvs kvs = {{"level", "info"}, {"user", "42"}};
    sink.emitEvent("myjob", "login", kvs);

    EXPECT_EQ(body(), "job:myjob event:login kvs:[level:info user:42]\n");
}

TEST_F(WriterSinkTest, UnparseableLevelIsLoggedAndRendered) {
    vital::WriterSink sink(b, vital::LogLevel::ERROR);
    vital::Kvs kvs = {{"level", "eror"}};
    sink.emitEvent("myjob", "myevent", kvs);

    EXPECT_EQ(body(), "job:myjob event:myevent kvs:[level:eror]\n");
}

TEST_F(WriterSinkTest, UsableThroughSinkInterface) {
    vital::WriterSink concrete(b, vital::LogLevel::INFO);
    vital::ISink &sink = concrete;
    sink.emitTiming("myjob", "myevent", 234203, watKvs());

    EXPECT_EQ(body(), "job:myjob event:myevent time:234 \xCE\xBCs kvs:[another:thing wat:ok]\n");
}

TEST_F(WriterSinkTest, ExposesConfiguration) {
    vital::WriterSink sink(b, vital::LogLevel::DEBUG);
    EXPECT_EQ(sink.level(), vital::LogLevel::DEBUG);
    EXPECT_NE(dynamic_cast<const vital::LineFormatter *>(&sink.formatter()), nullptr);
    EXPECT_NE(dynamic_cast<vital::StreamTransport *>(&sink.transport()), nullptr);
}

TEST_F(WriterSinkTest, NullTransportIsRejected) {
    std::unique_ptr<vital::ITransport> none;
    EXPECT_THROW({ vital::WriterSink sink(std::move(none)); }, std::invalid_argument);
}
