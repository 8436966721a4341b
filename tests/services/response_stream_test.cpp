/**
 * @file response_stream_test.cpp
 * @brief Tests for the pull-based response sequence and its channel writer
 */

#include <catch2/catch_test_macros.hpp>

#include <dicom_ul/services/response_stream.hpp>

#include <dicom_ul/core/result.hpp>
#include <dicom_ul/network/dimse/dimse_message.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dicom_ul;
using namespace dicom_ul::services;
using namespace dicom_ul::network::dimse;
using namespace std::chrono_literals;

namespace {

constexpr const char* STUDY_ROOT_FIND = "1.2.840.10008.5.1.4.1.2.2.1";

dimse_message find_rsp(status_code status) {
    return make_c_find_rsp(1, STUDY_ROOT_FIND, status);
}

}  // namespace

TEST_CASE("response_stream fixed sequences", "[services][response_stream]") {
    SECTION("default stream is empty") {
        response_stream stream;
        auto item = stream.next();
        REQUIRE(item.is_ok());
        CHECK_FALSE(item.value().has_value());
    }

    SECTION("single") {
        auto stream = response_stream::single(find_rsp(status_success));
        auto all = stream.collect();
        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 1);
        CHECK(all.value()[0].status() == status_success);
        CHECK_FALSE(stream.next().value().has_value());
    }

    SECTION("from_messages keeps order") {
        auto stream = response_stream::from_messages(
            {find_rsp(status_pending), find_rsp(status_pending), find_rsp(status_success)});
        auto all = stream.collect();
        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 3);
        CHECK(all.value()[0].status() == status_pending);
        CHECK(all.value()[2].status() == status_success);
    }

    SECTION("failed reports the error once") {
        auto stream = response_stream::failed(
            error_info{error_codes::service_processing_failed, "boom", "test"});
        auto first = stream.next();
        REQUIRE(first.is_err());
        CHECK(first.error().code == error_codes::service_processing_failed);
        auto second = stream.next();
        REQUIRE(second.is_ok());
        CHECK_FALSE(second.value().has_value());
    }
}

TEST_CASE("response_stream generators are pulled lazily", "[services][response_stream]") {
    int produced = 0;
    auto stream = response_stream::from_generator([&produced]() -> response_stream::next_result {
        if (produced == 3) {
            return std::optional<dimse_message>{};
        }
        ++produced;
        return std::optional<dimse_message>{
            find_rsp(produced < 3 ? status_pending : status_success)};
    });

    CHECK(produced == 0);
    REQUIRE(stream.next().value().has_value());
    CHECK(produced == 1);

    SECTION("drain") {
        auto rest = stream.collect();
        REQUIRE(rest.is_ok());
        CHECK(rest.value().size() == 2);
        CHECK(produced == 3);
    }

    SECTION("close stops pulling") {
        stream.close();
        CHECK(stream.is_closed());
        auto item = stream.next();
        REQUIRE(item.is_err());
        CHECK(item.error().code == error_codes::stream_closed);
        CHECK(produced == 1);
    }

    SECTION("copies share the sequence") {
        auto copy = stream;
        REQUIRE(copy.next().value().has_value());
        CHECK(produced == 2);
        copy.close();
        CHECK(stream.is_closed());
    }
}

TEST_CASE("response_stream generator errors end the sequence", "[services][response_stream]") {
    int calls = 0;
    auto stream = response_stream::from_generator([&calls]() -> response_stream::next_result {
        ++calls;
        if (calls == 1) {
            return std::optional<dimse_message>{find_rsp(status_pending)};
        }
        return error_info{error_codes::service_processing_failed, "database gone", "test"};
    });

    auto all = stream.collect();
    REQUIRE(all.is_err());
    CHECK(all.error().message == "database gone");
    CHECK_FALSE(stream.next().value().has_value());
    CHECK(calls == 2);
}

TEST_CASE("response_stream turns a throwing generator into an error",
          "[services][response_stream]") {
    int calls = 0;
    auto stream = response_stream::from_generator([&calls]() -> response_stream::next_result {
        if (++calls == 1) {
            return std::optional<dimse_message>{find_rsp(status_pending)};
        }
        throw std::runtime_error("cursor invalidated");
    });

    auto first = stream.next();
    REQUIRE(first.is_ok());
    REQUIRE(first.value().has_value());

    auto second = stream.next();
    REQUIRE(second.is_err());
    CHECK(second.error().code == error_codes::service_processing_failed);
    CHECK(second.error().message == "cursor invalidated");

    // The generator is not pulled again once it has failed
    auto after = stream.next();
    REQUIRE(after.is_ok());
    CHECK_FALSE(after.value().has_value());
    CHECK(calls == 2);
}

TEST_CASE("response_stream channel", "[services][response_stream]") {
    auto [stream, writer] = response_stream::channel();

    SECTION("messages pushed from another thread arrive in order") {
        std::thread producer([w = writer]() {
            (void)w->push(find_rsp(status_pending));
            std::this_thread::sleep_for(20ms);
            (void)w->push(find_rsp(status_success));
            w->finish();
        });

        auto all = stream.collect();
        producer.join();
        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 2);
        CHECK(all.value()[1].status() == status_success);
    }

    SECTION("fail delivers the error after earlier messages") {
        REQUIRE(writer->push(find_rsp(status_pending)).is_ok());
        writer->fail(error_info{error_codes::association_aborted, "aborted", "test"});

        REQUIRE(stream.next().value().has_value());
        auto err = stream.next();
        REQUIRE(err.is_err());
        CHECK(err.error().code == error_codes::association_aborted);
    }

    SECTION("push after finish is refused") {
        writer->finish();
        auto pushed = writer->push(find_rsp(status_success));
        REQUIRE(pushed.is_err());
        CHECK(pushed.error().code == error_codes::stream_closed);
    }

    SECTION("close wakes a blocked pull and is visible to the writer") {
        std::thread closer([s = stream]() mutable {
            std::this_thread::sleep_for(30ms);
            s.close();
        });

        auto item = stream.next();
        closer.join();
        REQUIRE(item.is_err());
        CHECK(item.error().code == error_codes::stream_closed);
        CHECK(writer->is_closed());
        CHECK(writer->push(find_rsp(status_success)).is_err());
    }

    SECTION("dropping the writer finishes the stream") {
        REQUIRE(writer->push(find_rsp(status_success)).is_ok());
        writer.reset();
        auto all = stream.collect();
        REQUIRE(all.is_ok());
        CHECK(all.value().size() == 1);
    }
}
