// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing shared by the server listener and the client.
// Each frame: 4-byte big-endian payload length followed by a serialized protobuf message.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace hax::netutil {

inline constexpr uint32_t kMaxFrameBytes = 10'000'000;

inline std::string build_frame(const std::string &payload)
{
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint32_t net = htonl(len);
    std::string frame;
    frame.resize(4 + payload.size());
    std::memcpy(frame.data(), &net, 4);
    std::memcpy(frame.data() + 4, payload.data(), payload.size());
    return frame;
}

// Serialize a protobuf message and append its frame to out. Returns false if serialization failed.
template <typename Message>
inline bool append_frame(std::string &out, const Message &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
        return false;
    out += build_frame(payload);
    return true;
}

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};
    bool corrupt{false}; // set once an invalid length prefix was seen; the stream cannot recover
};

inline void feed(FrameParseState &st, std::span<const char> bytes)
{
    st.buffer.insert(st.buffer.end(), bytes.begin(), bytes.end());
}

// Try extract one frame; returns true if a complete payload was extracted into out.
inline bool try_extract(FrameParseState &st, std::string &out)
{
    if (st.corrupt)
        return false;
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return false;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes) {
            st.corrupt = true;
            return false;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + st.expected_len)
        return false;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return true;
}

} // namespace hax::netutil
