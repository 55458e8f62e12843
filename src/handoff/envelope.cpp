#include <handoff/envelope.h>
#include <ytrace/ytrace.hpp>

namespace handoff {

const char* toString(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Canvas: return "CANVAS";
        case MessageKind::PluginChannelRequest: return "PLUGIN_CHANNEL_REQUEST";
        case MessageKind::PluginChannelCreated: return "PLUGIN_CHANNEL_CREATED";
        case MessageKind::Other: return "OTHER";
    }
    return "UNKNOWN";
}

std::optional<uint32_t> asTransferRef(const msgpack::object& obj) noexcept {
    if (obj.type != msgpack::type::EXT) return std::nullopt;
    if (obj.via.ext.type() != TransferRefExt || obj.via.ext.size != 4) return std::nullopt;
    const auto* b = reinterpret_cast<const unsigned char*>(obj.via.ext.data());
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) | uint32_t(b[3]);
}

namespace {

// Marks every transfer reference reachable from `obj`. Returns the first
// out-of-range index, if any.
std::optional<uint32_t> collectRefs(const msgpack::object& obj, std::vector<bool>& seen) {
    switch (obj.type) {
        case msgpack::type::EXT: {
            auto index = asTransferRef(obj);
            if (!index) return std::nullopt;
            if (*index >= seen.size()) return index;
            seen[*index] = true;
            return std::nullopt;
        }
        case msgpack::type::ARRAY:
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                if (auto bad = collectRefs(obj.via.array.ptr[i], seen)) return bad;
            }
            return std::nullopt;
        case msgpack::type::MAP:
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                if (auto bad = collectRefs(obj.via.map.ptr[i].key, seen)) return bad;
                if (auto bad = collectRefs(obj.via.map.ptr[i].val, seen)) return bad;
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

bool isDetached(const Transferable& t) {
    return std::visit([](const auto& resource) { return resource.isDetached(); }, t);
}

} // namespace

TransferableEnvelope::TransferableEnvelope(MessageKind kind, std::string payload,
                                           std::vector<Transferable> transferables)
    : _kind(kind), _payload(std::move(payload)), _transferables(std::move(transferables)) {}

TransferableEnvelope TransferableEnvelope::canvas(OffscreenSurface surface) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(buffer);
    pk.pack_map(2);
    pk.pack(std::string("type"));
    pk.pack(std::string(CanvasMessageType));
    pk.pack(std::string("canvas"));
    packTransferRef(pk, 0);

    std::vector<Transferable> transferables;
    transferables.emplace_back(std::move(surface));
    return TransferableEnvelope(MessageKind::Canvas, std::string(buffer.data(), buffer.size()),
                                std::move(transferables));
}

TransferableEnvelope TransferableEnvelope::pluginChannelRequest() {
    return TransferableEnvelope(MessageKind::PluginChannelRequest,
                                encodePayload(std::string(PluginChannelRequestMarker)));
}

TransferableEnvelope TransferableEnvelope::pluginChannelCreated(const std::string& channel,
                                                                std::vector<MessagePort> ports) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(buffer);
    pk.pack_map(3);
    pk.pack(std::string("type"));
    pk.pack(std::string(PluginChannelCreatedType));
    pk.pack(std::string("channel"));
    pk.pack(channel);
    pk.pack(std::string("ports"));
    pk.pack_array(static_cast<uint32_t>(ports.size()));
    for (uint32_t i = 0; i < ports.size(); ++i) {
        packTransferRef(pk, i);
    }

    std::vector<Transferable> transferables;
    transferables.reserve(ports.size());
    for (auto& port : ports) {
        transferables.emplace_back(std::move(port));
    }
    return TransferableEnvelope(MessageKind::PluginChannelCreated,
                                std::string(buffer.data(), buffer.size()),
                                std::move(transferables));
}

Result<msgpack::object_handle> TransferableEnvelope::decodePayload() const {
    if (_payload.empty()) {
        return Ok(msgpack::object_handle());
    }
    try {
        return Ok(msgpack::unpack(_payload.data(), _payload.size()));
    } catch (const std::exception& e) {
        return Err<msgpack::object_handle>(ErrorCode::MalformedTransferList,
                                           std::string("payload is not valid msgpack: ") + e.what());
    }
}

Result<std::string> TransferableEnvelope::stringField(const std::string& key) const {
    auto decoded = decodePayload();
    if (!decoded) {
        return Err<std::string>("cannot read field '" + key + "'", decoded);
    }
    const msgpack::object& obj = decoded->get();
    if (obj.type != msgpack::type::MAP) {
        return Err<std::string>("payload is not a map");
    }
    for (uint32_t i = 0; i < obj.via.map.size; ++i) {
        const auto& kv = obj.via.map.ptr[i];
        if (kv.key.type != msgpack::type::STR || kv.key.as<std::string>() != key) continue;
        if (kv.val.type != msgpack::type::STR) {
            return Err<std::string>("field '" + key + "' is not a string");
        }
        return Ok(kv.val.as<std::string>());
    }
    return Err<std::string>("payload has no field '" + key + "'");
}

Result<void> TransferableEnvelope::validate() const {
    for (size_t i = 0; i < _transferables.size(); ++i) {
        if (isDetached(_transferables[i])) {
            return Err<void>(ErrorCode::MalformedTransferList,
                             "transferable " + std::to_string(i) + " is already detached");
        }
    }

    auto decoded = decodePayload();
    if (!decoded) {
        return Err<void>("invalid envelope", decoded);
    }

    std::vector<bool> seen(_transferables.size(), false);
    if (auto bad = collectRefs(decoded->get(), seen)) {
        return Err<void>(ErrorCode::MalformedTransferList,
                         "payload references transferable " + std::to_string(*bad) +
                         " but only " + std::to_string(_transferables.size()) + " were declared");
    }
    for (size_t i = 0; i < seen.size(); ++i) {
        if (!seen[i]) {
            return Err<void>(ErrorCode::MalformedTransferList,
                             "transferable " + std::to_string(i) + " is not reachable from the payload");
        }
    }
    return Ok();
}

Result<OffscreenSurface> TransferableEnvelope::takeSurface() {
    for (auto& t : _transferables) {
        if (auto* surface = std::get_if<OffscreenSurface>(&t); surface && !surface->isDetached()) {
            return Ok(std::move(*surface));
        }
    }
    return Err<OffscreenSurface>(ErrorCode::MissingTransferable,
                                 std::string(toString(_kind)) + " message carries no offscreen surface");
}

std::vector<MessagePort> TransferableEnvelope::takePorts() {
    std::vector<MessagePort> ports;
    for (auto& t : _transferables) {
        if (auto* port = std::get_if<MessagePort>(&t); port && !port->isDetached()) {
            ports.push_back(std::move(*port));
        }
    }
    return ports;
}

Result<void> TransferableEnvelope::prepareForTransfer() {
    for (auto& t : _transferables) {
        if (auto* port = std::get_if<MessagePort>(&t)) {
            if (auto res = port->prepareForTransfer(); !res) {
                return Err<void>(ErrorCode::MalformedTransferList, "cannot transfer port", res);
            }
        }
    }
    return Ok();
}

} // namespace handoff
