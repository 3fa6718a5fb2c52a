/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_inspector.h"

#include "msgpack/msgpack_decoder.h"
#include "msgpack/msgpack_projector.h"
#include "msgpack/msgpack_text_input.h"
#include "utils/log.h"

#include <chrono>
#include <utility>

namespace mpk {

static InspectResult failure(msgpack::ErrorKind kind, std::string message) {
    InspectResult out{};
    out.success = false;
    out.error_kind = kind;
    out.error_message = std::move(message);
    return out;
}

InspectResult MsgpackInspector::Inspect(
    std::string_view text,
    msgpack::InputFormat format,
    const InspectOptions& opt
) {
    if (msgpack::trim_ascii(text).empty()) {
        return failure(msgpack::ErrorKind::EmptyInput, "Empty input");
    }

    const auto t0 = std::chrono::steady_clock::now();
    std::vector<std::uint8_t> bytes;
    msgpack::InputFormat resolved = format;
    std::vector<std::string> notes;
    try {
        if (format == msgpack::InputFormat::Auto) {
            auto recovered = msgpack::detect_and_recover(text);
            bytes = std::move(recovered.bytes);
            resolved = recovered.format;
            notes = std::move(recovered.candidate_errors);
        } else {
            bytes = msgpack::recover_bytes(text, format);
        }
    } catch (const msgpack::MsgpackError& e) {
        MPK_LOG_DEBUG(opt.debug, "Input recovery failed: %s", e.what());
        return failure(e.kind(), e.what());
    }
    for (const auto& note : notes) {
        MPK_LOG_DEBUG(opt.debug, "Skipped candidate: %s", note.c_str());
    }

    if (bytes.empty()) {
        auto out = failure(msgpack::ErrorKind::EmptyInput, "Empty input");
        out.resolved_format = resolved;
        out.detect_notes = std::move(notes);
        return out;
    }
    const auto t1 = std::chrono::steady_clock::now();

    msgpack::DecodeOptions decode_opt{};
    decode_opt.max_depth = opt.max_depth;
    msgpack::DecodeResult decoded{};
    try {
        decoded = msgpack::decode_msgpack(bytes, decode_opt);
    } catch (const msgpack::MsgpackError& e) {
        MPK_LOG_DEBUG(
            opt.debug, "Decode failed (%s, %zu bytes): %s",
            std::string(msgpack::input_format_name(resolved)).c_str(), bytes.size(), e.what()
        );
        auto out = failure(e.kind(), e.what());
        out.resolved_format = resolved;
        out.detect_notes = std::move(notes);
        return out;
    }
    const auto t2 = std::chrono::steady_clock::now();

    InspectResult out{};
    out.success = true;
    out.root = std::move(decoded.root);
    out.resolved_format = resolved;
    out.consumed_bytes = decoded.consumed;
    out.trailing_bytes = bytes.size() - decoded.consumed;
    out.node_count = decoded.node_count;
    out.original_bytes = std::move(bytes);
    out.detect_notes = std::move(notes);

    if (opt.debug) {
        const auto recover_us =
            std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
        const auto decode_us =
            std::chrono::duration_cast<std::chrono::microseconds>(t2 - t1).count();
        MPK_LOG_DEBUG(
            true, "Inspect %s: bytes=%zu nodes=%llu recover=%lldus decode=%lldus",
            std::string(msgpack::input_format_name(out.resolved_format)).c_str(),
            out.original_bytes.size(), static_cast<unsigned long long>(out.node_count),
            static_cast<long long>(recover_us), static_cast<long long>(decode_us)
        );
        if (out.trailing_bytes != 0) {
            MPK_LOG_DEBUG(
                true, "%zu trailing byte(s) after the first value were not decoded",
                out.trailing_bytes
            );
        }
    }
    return out;
}

nlohmann::ordered_json MsgpackInspector::ToJson(const msgpack::DecodedNode& root) {
    return msgpack::project_node(root);
}

}  // namespace mpk
