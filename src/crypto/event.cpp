#include "nostrfs/crypto/event.hpp"
#include "nostrfs/utils/tools.hpp"
#include <stdexcept>

namespace nostrfs {
namespace crypto {

namespace {

Error requireString(const json& j, const std::string& key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return Error("event field '" + key + "' must be a string");
    }
    out = it->get<std::string>();
    return Error();
}

Error requireInteger(const json& j, const std::string& key, int64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return Error("event field '" + key + "' must be an integer");
    }
    out = it->get<int64_t>();
    return Error();
}

} // namespace

Result<Event> EventFromJSON(const json& j) {
    if (!j.is_object()) {
        return Error("event must be a JSON object");
    }

    Event event;
    Error err = requireString(j, "pubkey", event.pubkey);
    if (err.hasError()) return err;
    err = requireString(j, "sig", event.sig);
    if (err.hasError()) return err;
    err = requireString(j, "content", event.content);
    if (err.hasError()) return err;
    err = requireInteger(j, "created_at", event.createdAt);
    if (err.hasError()) return err;
    err = requireInteger(j, "kind", event.kind);
    if (err.hasError()) return err;

    auto tagsIt = j.find("tags");
    if (tagsIt == j.end() || !tagsIt->is_array()) {
        return Error("event field 'tags' must be an array");
    }
    for (const auto& tag : *tagsIt) {
        if (!tag.is_array()) {
            return Error("event tag must be an array");
        }
        std::vector<std::string> values;
        for (const auto& value : tag) {
            if (!value.is_string()) {
                return Error("event tag values must be strings");
            }
            values.push_back(value.get<std::string>());
        }
        event.tags.push_back(std::move(values));
    }

    auto idIt = j.find("id");
    if (idIt != j.end()) {
        if (!idIt->is_string()) {
            return Error("event field 'id' must be a string");
        }
        event.id = idIt->get<std::string>();
        if (!utils::IsLowerHex(event.id, EVENT_ID_HEX_LENGTH)) {
            return Error("event id must be " + std::to_string(EVENT_ID_HEX_LENGTH) + " lowercase hex characters");
        }
    }

    // 身份格式单独校验，不依赖签名验证隐式保证
    if (!utils::IsLowerHex(event.pubkey, PUBLIC_KEY_HEX_LENGTH)) {
        return Error("event pubkey must be " + std::to_string(PUBLIC_KEY_HEX_LENGTH) + " lowercase hex characters");
    }
    if (!utils::IsLowerHex(event.sig, SIGNATURE_HEX_LENGTH)) {
        return Error("event sig must be " + std::to_string(SIGNATURE_HEX_LENGTH) + " lowercase hex characters");
    }

    return event;
}

Result<Event> ParseEvent(const std::string& text) {
    try {
        return EventFromJSON(json::parse(text));
    } catch (const json::exception& e) {
        return Error(std::string("malformed event JSON: ") + e.what());
    }
}

json EventToJSON(const Event& event) {
    json j = {
        {"pubkey", event.pubkey},
        {"created_at", event.createdAt},
        {"kind", event.kind},
        {"tags", event.tags},
        {"content", event.content},
        {"sig", event.sig}
    };
    if (!event.id.empty()) {
        j["id"] = event.id;
    }
    return j;
}

Result<std::string> SerializeEvent(const Event& event) {
    json canonical = json::array({0, event.pubkey, event.createdAt, event.kind, event.tags, event.content});
    try {
        // 紧凑格式，非ASCII字符按UTF-8原样输出
        return canonical.dump();
    } catch (const json::exception& e) {
        return Error(std::string("failed to serialize event: ") + e.what());
    }
}

Result<std::string> ComputeEventID(const Event& event) {
    auto serialized = SerializeEvent(event);
    if (!serialized.ok()) {
        return serialized.error();
    }
    const std::string& text = serialized.value();
    auto hash = utils::CalculateSHA256Hash(std::vector<uint8_t>(text.begin(), text.end()));
    if (!hash.ok()) {
        return hash.error();
    }
    return utils::HexEncode(hash.value());
}

Error VerifyEvent(const Event& event, Verifier& verifier) {
    auto id = ComputeEventID(event);
    if (!id.ok()) {
        return id.error();
    }
    if (!event.id.empty() && event.id != id.value()) {
        return Error("event id does not match its content");
    }

    try {
        return verifier.Verify(utils::HexDecode(event.pubkey),
                               utils::HexDecode(event.sig),
                               utils::HexDecode(id.value()));
    } catch (const std::invalid_argument& e) {
        return Error(std::string("malformed hex in event: ") + e.what());
    }
}

Error SignEvent(Event& event, const std::vector<uint8_t>& secretKey,
                const std::vector<uint8_t>& auxRand) {
    auto pubkey = SchnorrPublicKey(secretKey);
    if (!pubkey.ok()) {
        return pubkey.error();
    }
    event.pubkey = utils::HexEncode(pubkey.value());

    auto id = ComputeEventID(event);
    if (!id.ok()) {
        return id.error();
    }
    event.id = id.value();

    auto sig = SchnorrSign(secretKey, utils::HexDecode(event.id), auxRand);
    if (!sig.ok()) {
        return sig.error();
    }
    event.sig = utils::HexEncode(sig.value());
    return Error();
}

} // namespace crypto
} // namespace nostrfs
