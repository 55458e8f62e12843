#pragma once

#include <handoff/message-port.h>
#include <handoff/offscreen-surface.h>
#include <handoff/result.hpp>
#include <msgpack.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace handoff {

enum class MessageKind : uint8_t {
    Canvas,                // window -> worker, carries the offscreen surface
    PluginChannelRequest,  // worker -> parent, marker string only
    PluginChannelCreated,  // parent -> worker, { channel } plus ports
    Other,
};

const char* toString(MessageKind kind) noexcept;

using Transferable = std::variant<OffscreenSurface, MessagePort>;

// msgpack ext type of a transfer reference; body is a big-endian uint32
// index into the envelope's transfer list.
constexpr int8_t TransferRefExt = 0x54;

constexpr const char* CanvasMessageType = "CANVAS";
constexpr const char* PluginChannelRequestMarker = "PLUGIN_CHANNEL_REQUEST";
constexpr const char* PluginChannelCreatedType = "PLUGIN_CHANNEL_CREATED";

template<typename Stream>
void packTransferRef(msgpack::packer<Stream>& pk, uint32_t index) {
    const char body[4] = {
        static_cast<char>((index >> 24) & 0xff),
        static_cast<char>((index >> 16) & 0xff),
        static_cast<char>((index >> 8) & 0xff),
        static_cast<char>(index & 0xff),
    };
    pk.pack_ext(sizeof(body), TransferRefExt);
    pk.pack_ext_body(body, sizeof(body));
}

// Index of a transfer reference, nullopt for any other msgpack value
std::optional<uint32_t> asTransferRef(const msgpack::object& obj) noexcept;

template<typename T>
std::string encodePayload(const T& value) {
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, value);
    return std::string(buffer.data(), buffer.size());
}

// A typed message plus the resources that move with it.
//
// The payload is msgpack. Every transferable must be referenced from it at
// least once (see packTransferRef); the port checks this on send. The
// envelope is built right before a send and consumed by the receiver.
class TransferableEnvelope {
public:
    TransferableEnvelope() = default;
    TransferableEnvelope(MessageKind kind, std::string payload,
                         std::vector<Transferable> transferables = {});

    TransferableEnvelope(TransferableEnvelope&&) noexcept = default;
    TransferableEnvelope& operator=(TransferableEnvelope&&) noexcept = default;
    TransferableEnvelope(const TransferableEnvelope&) = delete;
    TransferableEnvelope& operator=(const TransferableEnvelope&) = delete;

    static TransferableEnvelope canvas(OffscreenSurface surface);
    static TransferableEnvelope pluginChannelRequest();
    static TransferableEnvelope pluginChannelCreated(const std::string& channel,
                                                     std::vector<MessagePort> ports);

    MessageKind kind() const noexcept { return _kind; }
    const std::string& payload() const noexcept { return _payload; }
    const std::vector<Transferable>& transferables() const noexcept { return _transferables; }
    size_t transferableCount() const noexcept { return _transferables.size(); }

    Result<msgpack::object_handle> decodePayload() const;

    // String value stored under `key` in a map payload
    Result<std::string> stringField(const std::string& key) const;

    // References in range, every transferable referenced, none detached
    Result<void> validate() const;

    // First offscreen surface in the transfer list
    Result<OffscreenSurface> takeSurface();

    // All ports in the transfer list, in order
    std::vector<MessagePort> takePorts();

private:
    friend class MessagePort;

    Result<void> prepareForTransfer();

    MessageKind _kind = MessageKind::Other;
    std::string _payload;
    std::vector<Transferable> _transferables;
};

} // namespace handoff
