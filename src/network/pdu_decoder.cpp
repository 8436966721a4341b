#include "dicom_ul/network/pdu_decoder.hpp"

#include <utility>
#include <vector>

namespace dicom_ul::network {

namespace {

/// Body size of A-ASSOCIATE-RJ, A-RELEASE-RQ/RP and A-ABORT
constexpr size_t FIXED_PDU_BODY_SIZE = 4;

/// Version(2) + reserved(2) + called AE(16) + calling AE(16) + reserved(32)
constexpr size_t ASSOCIATE_HEADER_SIZE = ASSOCIATE_FIXED_SIZE - PDU_HEADER_SIZE;

template<typename T>
DecodeResult<T> decode_error(int code, const std::string& msg) {
    return make_ul_error<T>(code, msg, "pdu_decoder");
}

uint16_t read_uint16_be(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint16_t>(
        (static_cast<uint16_t>(data[offset]) << 8) |
        static_cast<uint16_t>(data[offset + 1]));
}

uint32_t read_uint32_be(std::span<const uint8_t> data, size_t offset) {
    return (static_cast<uint32_t>(data[offset]) << 24) |
           (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) |
           static_cast<uint32_t>(data[offset + 3]);
}

std::string hex_byte(uint8_t value) {
    static constexpr char digits[] = "0123456789ABCDEF";
    return std::string{"0x"} + digits[value >> 4] + digits[value & 0x0F];
}

/**
 * @brief One item or sub-item: type(1) reserved(1) length(2) body.
 */
struct item_view {
    uint8_t type;
    std::span<const uint8_t> body;
};

/**
 * @brief Split a variable-item region into items, rejecting any overrun.
 */
DecodeResult<std::vector<item_view>> split_items(std::span<const uint8_t> data) {
    std::vector<item_view> items;
    size_t pos = 0;

    while (pos < data.size()) {
        if (pos + 4 > data.size()) {
            return decode_error<std::vector<item_view>>(
                error_codes::malformed_pdu, "Incomplete item header");
        }

        const uint8_t type = data[pos];
        const uint16_t length = read_uint16_be(data, pos + 2);
        pos += 4;

        if (pos + length > data.size()) {
            return decode_error<std::vector<item_view>>(
                error_codes::malformed_pdu,
                "Item " + hex_byte(type) + " length " + std::to_string(length) +
                    " exceeds enclosing bounds");
        }

        items.push_back(item_view{type, data.subspan(pos, length)});
        pos += length;
    }

    return items;
}

/**
 * @brief Shared grammar of A-ASSOCIATE-RQ and A-ASSOCIATE-AC bodies.
 *
 * @tparam Pdu associate_rq or associate_ac
 * @param pc_item The presentation context item type legal for this PDU
 * @param read_title AE title reader
 * @param decode_pc Presentation context item decoder
 * @param decode_user_info User information item decoder
 */
template<typename Pdu, typename TitleReader, typename PcDecoder, typename UserInfoDecoder,
         typename UidReader>
DecodeResult<Pdu> decode_associate(std::span<const uint8_t> body, item_type pc_item,
                                   TitleReader read_title, PcDecoder decode_pc,
                                   UserInfoDecoder decode_user_info, UidReader read_uid) {
    if (body.size() < ASSOCIATE_HEADER_SIZE) {
        return decode_error<Pdu>(error_codes::malformed_pdu,
            "Associate PDU body of " + std::to_string(body.size()) +
                " bytes is shorter than the fixed header");
    }

    Pdu result;
    result.protocol_version = read_uint16_be(body, 0);
    if ((result.protocol_version & 0x0001) == 0) {
        return decode_error<Pdu>(error_codes::invalid_protocol_version,
            "Protocol version " + std::to_string(result.protocol_version) +
                " does not support version 1");
    }

    auto called = read_title(body, 4);
    if (called.is_err()) {
        return called.error();
    }
    auto calling = read_title(body, 20);
    if (calling.is_err()) {
        return calling.error();
    }
    result.called_ae_title = std::move(called.value());
    result.calling_ae_title = std::move(calling.value());

    auto items = split_items(body.subspan(ASSOCIATE_HEADER_SIZE));
    if (items.is_err()) {
        return items.error();
    }

    bool have_context = false;
    bool have_user_info = false;

    for (const auto& item : items.value()) {
        if (item.type == static_cast<uint8_t>(item_type::application_context)) {
            if (have_context) {
                return decode_error<Pdu>(error_codes::malformed_pdu,
                    "Duplicate application context item");
            }
            result.application_context = read_uid(item.body);
            have_context = true;
        } else if (item.type == static_cast<uint8_t>(pc_item)) {
            auto pc = decode_pc(item.body);
            if (pc.is_err()) {
                return pc.error();
            }
            result.presentation_contexts.push_back(std::move(pc.value()));
        } else if (item.type == static_cast<uint8_t>(item_type::user_information)) {
            if (have_user_info) {
                return decode_error<Pdu>(error_codes::malformed_pdu,
                    "Duplicate user information item");
            }
            auto ui = decode_user_info(item.body);
            if (ui.is_err()) {
                return ui.error();
            }
            result.user_info = std::move(ui.value());
            have_user_info = true;
        } else {
            return decode_error<Pdu>(error_codes::invalid_item_type,
                "Unexpected item " + hex_byte(item.type) + " in associate PDU");
        }
    }

    if (!have_context) {
        return decode_error<Pdu>(error_codes::malformed_pdu,
            "Missing application context item");
    }

    return result;
}

}  // namespace

// ============================================================================
// Helper Functions
// ============================================================================

DecodeResult<std::string> pdu_decoder::read_ae_title(std::span<const uint8_t> data,
                                                     size_t offset) {
    std::string ae_title;
    ae_title.reserve(AE_TITLE_LENGTH);

    for (size_t i = 0; i < AE_TITLE_LENGTH; ++i) {
        const uint8_t c = data[offset + i];
        if (c != 0x00 && (c < 0x20 || c > 0x7E)) {
            return decode_error<std::string>(error_codes::invalid_ae_title,
                "AE title contains byte " + hex_byte(c));
        }
        ae_title.push_back(static_cast<char>(c));
    }

    // Leading and trailing spaces are insignificant; NUL is tolerated as padding
    const auto last = ae_title.find_last_not_of(std::string{" \0", 2});
    if (last == std::string::npos) {
        return std::string{};
    }
    ae_title.resize(last + 1);
    const auto first = ae_title.find_first_not_of(' ');
    ae_title.erase(0, first);

    if (ae_title.find('\0') != std::string::npos) {
        return decode_error<std::string>(error_codes::invalid_ae_title,
            "AE title contains embedded NUL");
    }
    return ae_title;
}

std::string pdu_decoder::read_uid(std::span<const uint8_t> data) {
    std::string uid(reinterpret_cast<const char*>(data.data()), data.size());
    while (!uid.empty() && (uid.back() == '\0' || uid.back() == ' ')) {
        uid.pop_back();
    }
    return uid;
}

// ============================================================================
// General Decoding
// ============================================================================

std::optional<size_t> pdu_decoder::pdu_length(std::span<const uint8_t> data) {
    if (data.size() < PDU_HEADER_SIZE) {
        return std::nullopt;
    }
    return PDU_HEADER_SIZE + static_cast<size_t>(read_uint32_be(data, 2));
}

std::optional<pdu_type> pdu_decoder::peek_pdu_type(std::span<const uint8_t> data) {
    if (data.empty()) {
        return std::nullopt;
    }

    switch (data[0]) {
        case 0x01: return pdu_type::associate_rq;
        case 0x02: return pdu_type::associate_ac;
        case 0x03: return pdu_type::associate_rj;
        case 0x04: return pdu_type::p_data_tf;
        case 0x05: return pdu_type::release_rq;
        case 0x06: return pdu_type::release_rp;
        case 0x07: return pdu_type::abort;
        default: return std::nullopt;
    }
}

DecodeResult<pdu> pdu_decoder::decode(std::span<const uint8_t> data,
                                      uint32_t max_pdu_length) {
    if (data.size() < PDU_HEADER_SIZE) {
        return decode_error<pdu>(error_codes::incomplete_pdu,
            "Incomplete PDU header: " + std::to_string(data.size()) + " bytes");
    }

    const auto type = peek_pdu_type(data);
    if (!type) {
        return decode_error<pdu>(error_codes::invalid_pdu_type,
            "Unknown PDU type " + hex_byte(data[0]));
    }

    const uint32_t length = read_uint32_be(data, 2);
    if (max_pdu_length != 0 && length > max_pdu_length) {
        return decode_error<pdu>(error_codes::pdu_too_large,
            std::string(to_string(*type)) + " length " + std::to_string(length) +
                " exceeds limit " + std::to_string(max_pdu_length));
    }

    const size_t total = PDU_HEADER_SIZE + static_cast<size_t>(length);
    if (data.size() < total) {
        return decode_error<pdu>(error_codes::incomplete_pdu,
            "Need " + std::to_string(total) + " bytes, have " +
                std::to_string(data.size()));
    }
    if (data.size() > total) {
        return decode_error<pdu>(error_codes::malformed_pdu,
            "Declared length " + std::to_string(length) + " does not match body of " +
                std::to_string(data.size() - PDU_HEADER_SIZE) + " bytes");
    }

    const auto body = data.subspan(PDU_HEADER_SIZE);

    auto wrap = [](auto result) -> DecodeResult<pdu> {
        if (result.is_err()) {
            return result.error();
        }
        return pdu{std::move(result.value())};
    };

    switch (*type) {
        case pdu_type::associate_rq:
            return wrap(decode_associate_rq(body));
        case pdu_type::associate_ac:
            return wrap(decode_associate_ac(body));
        case pdu_type::associate_rj:
            return wrap(decode_associate_rj(body));
        case pdu_type::p_data_tf:
            return wrap(decode_p_data_tf(body));
        case pdu_type::abort:
            return wrap(decode_abort(body));
        case pdu_type::release_rq:
        case pdu_type::release_rp:
            break;
    }

    if (body.size() != FIXED_PDU_BODY_SIZE) {
        return decode_error<pdu>(error_codes::malformed_pdu,
            std::string(to_string(*type)) + " must carry a 4-byte body");
    }
    if (*type == pdu_type::release_rq) {
        return pdu{release_rq_pdu{}};
    }
    return pdu{release_rp_pdu{}};
}

// ============================================================================
// Associate PDUs
// ============================================================================

DecodeResult<associate_rq> pdu_decoder::decode_associate_rq(std::span<const uint8_t> body) {
    auto result = decode_associate<associate_rq>(
        body, item_type::presentation_context_rq,
        [](std::span<const uint8_t> d, size_t off) { return read_ae_title(d, off); },
        [](std::span<const uint8_t> item) { return decode_presentation_context_rq(item); },
        [](std::span<const uint8_t> item) { return decode_user_info_item(item); },
        [](std::span<const uint8_t> d) { return read_uid(d); });

    if (result.is_ok() && result.value().presentation_contexts.empty()) {
        return decode_error<associate_rq>(error_codes::malformed_pdu,
            "A-ASSOCIATE-RQ carries no presentation context");
    }
    return result;
}

DecodeResult<associate_ac> pdu_decoder::decode_associate_ac(std::span<const uint8_t> body) {
    return decode_associate<associate_ac>(
        body, item_type::presentation_context_ac,
        [](std::span<const uint8_t> d, size_t off) { return read_ae_title(d, off); },
        [](std::span<const uint8_t> item) { return decode_presentation_context_ac(item); },
        [](std::span<const uint8_t> item) { return decode_user_info_item(item); },
        [](std::span<const uint8_t> d) { return read_uid(d); });
}

DecodeResult<presentation_context_rq> pdu_decoder::decode_presentation_context_rq(
    std::span<const uint8_t> item) {
    // ID(1) + reserved(3), then one abstract syntax and 1..n transfer syntaxes
    if (item.size() < 4) {
        return decode_error<presentation_context_rq>(error_codes::malformed_pdu,
            "Presentation context item too short");
    }

    presentation_context_rq pc;
    pc.id = item[0];

    auto sub_items = split_items(item.subspan(4));
    if (sub_items.is_err()) {
        return sub_items.error();
    }

    bool have_abstract = false;
    for (const auto& sub : sub_items.value()) {
        if (sub.type == static_cast<uint8_t>(item_type::abstract_syntax)) {
            if (have_abstract) {
                return decode_error<presentation_context_rq>(error_codes::malformed_pdu,
                    "Duplicate abstract syntax in context " + std::to_string(pc.id));
            }
            pc.abstract_syntax = read_uid(sub.body);
            have_abstract = true;
        } else if (sub.type == static_cast<uint8_t>(item_type::transfer_syntax)) {
            pc.transfer_syntaxes.push_back(read_uid(sub.body));
        } else {
            return decode_error<presentation_context_rq>(error_codes::invalid_item_type,
                "Unexpected sub-item " + hex_byte(sub.type) + " in context " +
                    std::to_string(pc.id));
        }
    }

    if (!have_abstract || pc.transfer_syntaxes.empty()) {
        return decode_error<presentation_context_rq>(error_codes::malformed_pdu,
            "Context " + std::to_string(pc.id) +
                " needs one abstract syntax and at least one transfer syntax");
    }
    return pc;
}

DecodeResult<presentation_context_ac> pdu_decoder::decode_presentation_context_ac(
    std::span<const uint8_t> item) {
    // ID(1) + reserved(1) + result(1) + reserved(1), then one transfer syntax
    if (item.size() < 4) {
        return decode_error<presentation_context_ac>(error_codes::malformed_pdu,
            "Presentation context item too short");
    }

    presentation_context_ac pc;
    pc.id = item[0];
    if (item[2] > static_cast<uint8_t>(presentation_context_result::transfer_syntaxes_not_supported)) {
        return decode_error<presentation_context_ac>(error_codes::malformed_pdu,
            "Invalid result " + std::to_string(item[2]) + " for context " +
                std::to_string(pc.id));
    }
    pc.result = static_cast<presentation_context_result>(item[2]);

    auto sub_items = split_items(item.subspan(4));
    if (sub_items.is_err()) {
        return sub_items.error();
    }

    bool have_ts = false;
    for (const auto& sub : sub_items.value()) {
        if (sub.type != static_cast<uint8_t>(item_type::transfer_syntax)) {
            return decode_error<presentation_context_ac>(error_codes::invalid_item_type,
                "Unexpected sub-item " + hex_byte(sub.type) + " in context " +
                    std::to_string(pc.id));
        }
        if (have_ts) {
            return decode_error<presentation_context_ac>(error_codes::malformed_pdu,
                "Multiple transfer syntaxes in accepted context " + std::to_string(pc.id));
        }
        pc.transfer_syntax = read_uid(sub.body);
        have_ts = true;
    }

    if (pc.accepted() && pc.transfer_syntax.empty()) {
        return decode_error<presentation_context_ac>(error_codes::malformed_pdu,
            "Accepted context " + std::to_string(pc.id) + " has no transfer syntax");
    }
    return pc;
}

DecodeResult<user_information> pdu_decoder::decode_user_info_item(
    std::span<const uint8_t> item) {
    auto sub_items = split_items(item);
    if (sub_items.is_err()) {
        return sub_items.error();
    }

    user_information ui;
    for (const auto& sub : sub_items.value()) {
        switch (static_cast<item_type>(sub.type)) {
            case item_type::maximum_length:
                if (sub.body.size() != 4) {
                    return decode_error<user_information>(error_codes::malformed_pdu,
                        "Maximum length sub-item must be 4 bytes");
                }
                ui.max_pdu_length = read_uint32_be(sub.body, 0);
                break;

            case item_type::implementation_class_uid:
                ui.implementation_class_uid = read_uid(sub.body);
                break;

            case item_type::implementation_version_name:
                ui.implementation_version_name = read_uid(sub.body);
                break;

            case item_type::scp_scu_role_selection: {
                if (sub.body.size() < 2) {
                    return decode_error<user_information>(error_codes::malformed_pdu,
                        "Role selection sub-item too short");
                }
                const uint16_t uid_length = read_uint16_be(sub.body, 0);
                if (sub.body.size() != static_cast<size_t>(2 + uid_length + 2)) {
                    return decode_error<user_information>(error_codes::malformed_pdu,
                        "Role selection UID length does not match sub-item length");
                }
                scp_scu_role_selection role;
                role.sop_class_uid = read_uid(sub.body.subspan(2, uid_length));
                role.scu_role = sub.body[2 + uid_length] != 0;
                role.scp_role = sub.body[3 + uid_length] != 0;
                ui.role_selections.push_back(std::move(role));
                break;
            }

            default:
                // Asynchronous operations window, extended negotiation, user
                // identity and unknown sub-items are ignorable
                break;
        }
    }

    return ui;
}

// ============================================================================
// Fixed-size PDUs
// ============================================================================

DecodeResult<associate_rj> pdu_decoder::decode_associate_rj(std::span<const uint8_t> body) {
    if (body.size() != FIXED_PDU_BODY_SIZE) {
        return decode_error<associate_rj>(error_codes::malformed_pdu,
            "A-ASSOCIATE-RJ must carry a 4-byte body");
    }

    if (body[1] != static_cast<uint8_t>(reject_result::rejected_permanent) &&
        body[1] != static_cast<uint8_t>(reject_result::rejected_transient)) {
        return decode_error<associate_rj>(error_codes::malformed_pdu,
            "Invalid reject result " + std::to_string(body[1]));
    }

    return associate_rj{static_cast<reject_result>(body[1]), body[2], body[3]};
}

DecodeResult<abort_pdu> pdu_decoder::decode_abort(std::span<const uint8_t> body) {
    if (body.size() != FIXED_PDU_BODY_SIZE) {
        return decode_error<abort_pdu>(error_codes::malformed_pdu,
            "A-ABORT must carry a 4-byte body");
    }

    return abort_pdu{static_cast<abort_source>(body[2]),
                     static_cast<abort_reason>(body[3])};
}

// ============================================================================
// P-DATA-TF Decoder
// ============================================================================

DecodeResult<p_data_tf_pdu> pdu_decoder::decode_p_data_tf(std::span<const uint8_t> body) {
    p_data_tf_pdu result;
    size_t pos = 0;

    while (pos < body.size()) {
        if (pos + 4 > body.size()) {
            return decode_error<p_data_tf_pdu>(error_codes::malformed_pdu,
                "Incomplete PDV item length");
        }

        const uint32_t item_length = read_uint32_be(body, pos);
        pos += 4;

        if (item_length < 2) {
            return decode_error<p_data_tf_pdu>(error_codes::malformed_pdu,
                "PDV item length too small");
        }
        if (item_length > body.size() - pos) {
            return decode_error<p_data_tf_pdu>(error_codes::malformed_pdu,
                "PDV item exceeds PDU bounds");
        }

        presentation_data_value pdv;
        pdv.context_id = body[pos];
        const uint8_t control = body[pos + 1];
        pdv.is_command = (control & 0x01) != 0;
        pdv.is_last = (control & 0x02) != 0;

        const auto value = body.subspan(pos + 2, item_length - 2);
        pdv.data.assign(value.begin(), value.end());
        pos += item_length;

        result.pdvs.push_back(std::move(pdv));
    }

    if (result.pdvs.empty()) {
        return decode_error<p_data_tf_pdu>(error_codes::malformed_pdu,
            "P-DATA-TF carries no PDV item");
    }
    return result;
}

}  // namespace dicom_ul::network
