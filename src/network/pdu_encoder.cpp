#include "dicom_ul/network/pdu_encoder.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace dicom_ul::network {

namespace {

/// Largest body a 2-byte item length can describe
constexpr std::size_t MAX_ITEM_LENGTH = 0xFFFF;

/// Big-endian byte sink with back-patched length fields.
class pdu_writer {
public:
    explicit pdu_writer(std::size_t reserve) { bytes_.reserve(reserve); }

    void u8(uint8_t value) { bytes_.push_back(value); }

    void u16(uint16_t value) {
        u8(static_cast<uint8_t>(value >> 8));
        u8(static_cast<uint8_t>(value));
    }

    void u32(uint32_t value) {
        u16(static_cast<uint16_t>(value >> 16));
        u16(static_cast<uint16_t>(value));
    }

    void zeros(std::size_t count) { bytes_.insert(bytes_.end(), count, 0x00); }

    void text(std::string_view value) {
        bytes_.insert(bytes_.end(), value.begin(), value.end());
    }

    void raw(const std::vector<uint8_t>& value) {
        bytes_.insert(bytes_.end(), value.begin(), value.end());
    }

    /// Type byte, reserved byte and a 2-byte length patched by close_item.
    auto open_item(item_type type) -> std::size_t {
        const auto start = bytes_.size();
        u8(static_cast<uint8_t>(type));
        u8(0x00);
        u16(0x0000);
        return start;
    }

    void close_item(std::size_t start) {
        const auto body = bytes_.size() - start - 4;
        if (body > MAX_ITEM_LENGTH && !oversized_) {
            oversized_ = static_cast<item_type>(bytes_[start]);
        }
        const auto length = static_cast<uint16_t>(body);
        bytes_[start + 2] = static_cast<uint8_t>(length >> 8);
        bytes_[start + 3] = static_cast<uint8_t>(length);
    }

    /// First item whose body did not fit its length field
    [[nodiscard]] std::optional<item_type> oversized_item() const noexcept {
        return oversized_;
    }

    /// Type byte, reserved byte and a 4-byte length patched by finish.
    void open_pdu(pdu_type type) {
        u8(static_cast<uint8_t>(type));
        u8(0x00);
        u32(0x00000000);
    }

    auto finish() -> std::vector<uint8_t> {
        const auto length = static_cast<uint32_t>(bytes_.size() - PDU_HEADER_SIZE);
        for (int i = 0; i < 4; ++i) {
            bytes_[2 + i] = static_cast<uint8_t>(length >> (24 - 8 * i));
        }
        return std::move(bytes_);
    }

    // AE titles are fixed 16 bytes, space padded
    void ae_title(std::string_view title) {
        const auto used = std::min(title.size(), AE_TITLE_LENGTH);
        text(title.substr(0, used));
        bytes_.insert(bytes_.end(), AE_TITLE_LENGTH - used, ' ');
    }

    // UID items carry an even length; odd UIDs get a trailing NUL
    void uid_item(item_type type, std::string_view uid) {
        const auto start = open_item(type);
        text(uid);
        if (uid.size() % 2 != 0) {
            u8(0x00);
        }
        close_item(start);
    }

private:
    std::vector<uint8_t> bytes_;
    std::optional<item_type> oversized_;
};

void write_context_rq(pdu_writer& out, const presentation_context_rq& pc) {
    const auto start = out.open_item(item_type::presentation_context_rq);
    out.u8(pc.id);
    out.zeros(3);
    out.uid_item(item_type::abstract_syntax, pc.abstract_syntax);
    for (const auto& ts : pc.transfer_syntaxes) {
        out.uid_item(item_type::transfer_syntax, ts);
    }
    out.close_item(start);
}

void write_context_ac(pdu_writer& out, const presentation_context_ac& pc) {
    const auto start = out.open_item(item_type::presentation_context_ac);
    out.u8(pc.id);
    out.u8(0x00);
    out.u8(static_cast<uint8_t>(pc.result));
    out.u8(0x00);
    // PS3.8 9.3.3.2: the sub-item is not significant when rejected, so it
    // is only written when a syntax was actually selected
    if (!pc.transfer_syntax.empty()) {
        out.uid_item(item_type::transfer_syntax, pc.transfer_syntax);
    }
    out.close_item(start);
}

void write_user_information(pdu_writer& out, const user_information& info) {
    const auto start = out.open_item(item_type::user_information);

    const auto max_length = out.open_item(item_type::maximum_length);
    out.u32(info.max_pdu_length);
    out.close_item(max_length);

    if (!info.implementation_class_uid.empty()) {
        out.uid_item(item_type::implementation_class_uid, info.implementation_class_uid);
    }

    // The role UID has its own length prefix and is written unpadded
    for (const auto& role : info.role_selections) {
        const auto item = out.open_item(item_type::scp_scu_role_selection);
        out.u16(static_cast<uint16_t>(role.sop_class_uid.size()));
        out.text(role.sop_class_uid);
        out.u8(role.scu_role ? 0x01 : 0x00);
        out.u8(role.scp_role ? 0x01 : 0x00);
        out.close_item(item);
    }

    if (!info.implementation_version_name.empty()) {
        const auto item = out.open_item(item_type::implementation_version_name);
        out.text(info.implementation_version_name);
        out.close_item(item);
    }

    out.close_item(start);
}

template <typename Associate, typename WriteContext>
void write_associate(pdu_writer& out, pdu_type type, const Associate& msg,
                     WriteContext write_context) {
    out.open_pdu(type);
    out.u16(msg.protocol_version);
    out.zeros(2);
    out.ae_title(msg.called_ae_title);
    out.ae_title(msg.calling_ae_title);
    out.zeros(32);

    out.uid_item(item_type::application_context,
                 msg.application_context.empty() ? std::string_view{DICOM_APPLICATION_CONTEXT}
                                                 : std::string_view{msg.application_context});
    for (const auto& pc : msg.presentation_contexts) {
        write_context(out, pc);
    }
    write_user_information(out, msg.user_info);
}

template <typename Associate, typename WriteContext>
auto check_associate(pdu_type type, const Associate& msg, WriteContext write_context)
    -> VoidResult {
    pdu_writer out(512);
    write_associate(out, type, msg, write_context);
    const auto item = out.oversized_item();
    if (!item) {
        return ok();
    }
    constexpr const char* hex = "0123456789ABCDEF";
    const auto code = static_cast<uint8_t>(*item);
    std::string name = "0x";
    name += hex[code >> 4];
    name += hex[code & 0x0F];
    return make_ul_void_error(error_codes::pdu_too_large,
        std::string(to_string(type)) + " item " + name + " exceeds " +
            std::to_string(MAX_ITEM_LENGTH) + " bytes",
        "pdu_encoder");
}

// A-ASSOCIATE-RJ, A-RELEASE-RQ/RP and A-ABORT share one 10-byte layout
auto write_short_pdu(pdu_type type, uint8_t first, uint8_t second, uint8_t third)
    -> std::vector<uint8_t> {
    pdu_writer out(10);
    out.open_pdu(type);
    out.u8(0x00);
    out.u8(first);
    out.u8(second);
    out.u8(third);
    return out.finish();
}

}  // namespace

std::vector<uint8_t> pdu_encoder::encode(const pdu& value) {
    return std::visit(
        [](const auto& body) -> std::vector<uint8_t> {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, associate_rq>) {
                return encode_associate_rq(body);
            } else if constexpr (std::is_same_v<T, associate_ac>) {
                return encode_associate_ac(body);
            } else if constexpr (std::is_same_v<T, associate_rj>) {
                return encode_associate_rj(body);
            } else if constexpr (std::is_same_v<T, p_data_tf_pdu>) {
                return encode_p_data_tf(body.pdvs);
            } else if constexpr (std::is_same_v<T, release_rq_pdu>) {
                return encode_release_rq();
            } else if constexpr (std::is_same_v<T, release_rp_pdu>) {
                return encode_release_rp();
            } else {
                return encode_abort(body.source, body.reason);
            }
        },
        value);
}

std::vector<uint8_t> pdu_encoder::encode_associate_rq(const associate_rq& rq) {
    pdu_writer out(512);
    write_associate(out, pdu_type::associate_rq, rq, write_context_rq);
    return out.finish();
}

std::vector<uint8_t> pdu_encoder::encode_associate_ac(const associate_ac& ac) {
    pdu_writer out(512);
    write_associate(out, pdu_type::associate_ac, ac, write_context_ac);
    return out.finish();
}

VoidResult pdu_encoder::validate(const associate_rq& rq) {
    return check_associate(pdu_type::associate_rq, rq, write_context_rq);
}

VoidResult pdu_encoder::validate(const associate_ac& ac) {
    return check_associate(pdu_type::associate_ac, ac, write_context_ac);
}

std::vector<uint8_t> pdu_encoder::encode_associate_rj(const associate_rj& rj) {
    return write_short_pdu(pdu_type::associate_rj, static_cast<uint8_t>(rj.result),
                           rj.source, rj.reason);
}

std::vector<uint8_t> pdu_encoder::encode_release_rq() {
    return write_short_pdu(pdu_type::release_rq, 0, 0, 0);
}

std::vector<uint8_t> pdu_encoder::encode_release_rp() {
    return write_short_pdu(pdu_type::release_rp, 0, 0, 0);
}

std::vector<uint8_t> pdu_encoder::encode_abort(abort_source source, abort_reason reason) {
    return write_short_pdu(pdu_type::abort, 0, static_cast<uint8_t>(source),
                           static_cast<uint8_t>(reason));
}

std::vector<uint8_t> pdu_encoder::encode_p_data_tf(
    const std::vector<presentation_data_value>& pdvs) {
    std::size_t total = PDU_HEADER_SIZE;
    for (const auto& pdv : pdvs) {
        total += 6 + pdv.data.size();
    }

    pdu_writer out(total);
    out.open_pdu(pdu_type::p_data_tf);
    for (const auto& pdv : pdvs) {
        // Item length covers the context ID, control header and fragment
        out.u32(static_cast<uint32_t>(2 + pdv.data.size()));
        out.u8(pdv.context_id);
        out.u8(pdv.control_header());
        out.raw(pdv.data);
    }
    return out.finish();
}

}  // namespace dicom_ul::network
