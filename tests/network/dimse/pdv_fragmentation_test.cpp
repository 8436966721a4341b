/**
 * @file pdv_fragmentation_test.cpp
 * @brief Tests for pdv_fragmenter and pdv_assembler
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <dicom_ul/network/dimse/dimse_message.hpp>
#include <dicom_ul/network/dimse/pdv_assembler.hpp>
#include <dicom_ul/network/dimse/pdv_fragmenter.hpp>
#include <dicom_ul/network/pdu_encoder.hpp>

#include <dicom_ul/core/dicom_dataset.hpp>
#include <dicom_ul/core/result.hpp>

#include <cstdint>
#include <vector>

using namespace dicom_ul;
using namespace dicom_ul::network;
using namespace dicom_ul::network::dimse;

namespace {

constexpr const char* IMPLICIT_VR_LE = "1.2.840.10008.1.2";

/// Encoded command set; announces a data set when @p with_dataset
std::vector<uint8_t> command_bytes(bool with_dataset) {
    auto rq = make_c_store_rq(1, "1.2.840.10008.5.1.4.1.1.2", "1.2.3.4.5.6.7.8.9");
    if (with_dataset) {
        rq.set_dataset(core::dicom_dataset{});
    }
    auto encoded = dimse_message::encode(rq, IMPLICIT_VR_LE);
    REQUIRE(encoded.is_ok());
    return encoded.value().first;
}

std::vector<uint8_t> pattern(std::size_t size) {
    std::vector<uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>(i * 31 + 7);
    }
    return bytes;
}

/// Feeds every PDV; returns the messages in completion order
std::vector<assembled_message> reassemble(pdv_assembler& assembler,
                                          const std::vector<p_data_tf_pdu>& pdus) {
    std::vector<assembled_message> messages;
    for (const auto& pdu : pdus) {
        for (const auto& pdv : pdu.pdvs) {
            auto result = assembler.add(pdv);
            REQUIRE(result.is_ok());
            if (result.value()) {
                messages.push_back(std::move(*result.value()));
            }
        }
    }
    return messages;
}

presentation_data_value pdv(uint8_t context, bool command, bool last,
                            std::vector<uint8_t> data = {0x00}) {
    return presentation_data_value(context, command, last, std::move(data));
}

}  // namespace

// ============================================================================
// pdv_fragmenter
// ============================================================================

TEST_CASE("pdv_fragmenter payload limits", "[dimse][pdv_fragmenter]") {
    CHECK(pdv_fragmenter::max_fragment_payload(16384) == 16384 - 12);
    CHECK(pdv_fragmenter::max_fragment_payload(UNLIMITED_MAX_PDU_LENGTH) == 0);
    CHECK(pdv_fragmenter::max_fragment_payload(40) == 28);
    CHECK(pdv_fragmenter::max_fragment_payload(MIN_DATA_PDU_LENGTH) == 1);
    // Limits with no room for payload still move one byte per PDU
    CHECK(pdv_fragmenter::max_fragment_payload(10) == 1);
    CHECK(pdv_fragmenter::max_fragment_payload(12) == 1);
}

TEST_CASE("pdv_fragmenter respects the PDU limit and reassembles losslessly",
          "[dimse][pdv_fragmenter][pdv_assembler]") {
    const uint32_t limit = GENERATE(20u, 64u, 128u, 1024u, 16384u);
    const std::size_t payload = limit - 12;
    const std::size_t size = GENERATE_COPY(values<std::size_t>(
        {0, 1, payload - 1, payload, payload + 1, 3 * static_cast<std::size_t>(limit) + 5}));

    CAPTURE(limit, size);

    const auto command = command_bytes(true);
    const auto dataset = pattern(size);

    pdv_fragmenter fragmenter(limit);
    auto pdus = fragmenter.fragment(3, command, dataset, true);
    REQUIRE_FALSE(pdus.empty());

    std::size_t last_flags = 0;
    for (const auto& p : pdus) {
        REQUIRE_FALSE(p.pdvs.empty());
        CHECK(pdu_encoder::encode_p_data_tf(p.pdvs).size() <= limit);
        for (const auto& value : p.pdvs) {
            CHECK(value.context_id == 3);
            CHECK(value.data.size() <= payload);
            if (value.is_last) {
                ++last_flags;
            }
        }
    }
    // One last fragment for the command and one for the data set
    CHECK(last_flags == 2);

    pdv_assembler assembler;
    auto messages = reassemble(assembler, pdus);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].context_id == 3);
    CHECK(messages[0].command == command);
    CHECK(messages[0].dataset == dataset);
    CHECK(messages[0].has_dataset);
    CHECK(assembler.idle());
}

TEST_CASE("pdv_fragmenter command-only messages", "[dimse][pdv_fragmenter]") {
    const auto command = command_bytes(false);

    SECTION("unlimited length puts everything in one PDV") {
        pdv_fragmenter fragmenter(UNLIMITED_MAX_PDU_LENGTH);
        auto pdus = fragmenter.fragment(1, command, {}, false);
        REQUIRE(pdus.size() == 1);
        REQUIRE(pdus[0].pdvs.size() == 1);
        CHECK(pdus[0].pdvs[0].is_command);
        CHECK(pdus[0].pdvs[0].is_last);
    }

    SECTION("small limit splits the command set") {
        pdv_fragmenter fragmenter(64);
        auto pdus = fragmenter.fragment(1, command, {}, false);
        CHECK(pdus.size() > 1);

        pdv_assembler assembler;
        auto messages = reassemble(assembler, pdus);
        REQUIRE(messages.size() == 1);
        CHECK_FALSE(messages[0].has_dataset);
        CHECK(messages[0].dataset.empty());
    }

    SECTION("small objects share one PDU") {
        pdv_fragmenter fragmenter(16384);
        auto pdus = fragmenter.fragment(1, command_bytes(true), pattern(10), true);
        REQUIRE(pdus.size() == 1);
        CHECK(pdus[0].pdvs.size() == 2);
    }
}

// ============================================================================
// pdv_assembler
// ============================================================================

TEST_CASE("pdv_assembler keeps contexts apart", "[dimse][pdv_assembler]") {
    const auto with_data = command_bytes(true);
    const auto without_data = command_bytes(false);

    pdv_assembler assembler;
    auto pending = assembler.add(pdv(1, true, true, with_data));
    REQUIRE(pending.is_ok());
    CHECK_FALSE(pending.value().has_value());
    CHECK(assembler.buffered_bytes() == with_data.size());

    // A complete command-only message on another context in between
    auto other = assembler.add(pdv(3, true, true, without_data));
    REQUIRE(other.is_ok());
    REQUIRE(other.value().has_value());
    CHECK(other.value()->context_id == 3);

    auto first = assembler.add(pdv(1, false, true, {0xAB, 0xCD}));
    REQUIRE(first.is_ok());
    REQUIRE(first.value().has_value());
    CHECK(first.value()->dataset == std::vector<uint8_t>{0xAB, 0xCD});
    CHECK(assembler.idle());
}

TEST_CASE("pdv_assembler rejects out-of-order fragments", "[dimse][pdv_assembler]") {
    pdv_assembler assembler;

    SECTION("data before command") {
        auto result = assembler.add(pdv(1, false, true));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::dimse_error);
    }

    SECTION("data for a command without a data set") {
        REQUIRE(assembler.add(pdv(1, true, true, command_bytes(false))).is_ok());
        // The command-only message completed; the context is free again
        CHECK(assembler.add(pdv(1, false, true)).is_err());
    }

    SECTION("command fragment while the data set is pending") {
        REQUIRE(assembler.add(pdv(1, true, true, command_bytes(true))).is_ok());
        CHECK(assembler.add(pdv(1, true, true, command_bytes(false))).is_err());
    }

    SECTION("undecodable command set") {
        CHECK(assembler.add(pdv(1, true, true, {0x00, 0x00, 0x00})).is_err());
    }

    // Errors drop the partial message for that context
    CHECK(assembler.idle());
}

TEST_CASE("pdv_assembler reset drops partial messages", "[dimse][pdv_assembler]") {
    pdv_assembler assembler;
    auto command = command_bytes(false);
    std::vector<uint8_t> head(command.begin(), command.begin() + 8);

    REQUIRE(assembler.add(pdv(1, true, false, head)).is_ok());
    CHECK_FALSE(assembler.idle());

    assembler.reset();
    CHECK(assembler.idle());
    CHECK(assembler.buffered_bytes() == 0);
}
