#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace CloudSync
{
// Opaque value identifying one connected sync root session (CF_CONNECTION_KEY).
struct ConnectionKey
{
    int64_t value = 0;

    friend bool operator==(const ConnectionKey&, const ConnectionKey&) = default;
};

// Opaque value identifying one in-flight transfer on a connection (CF_TRANSFER_KEY).
struct TransferKey
{
    int64_t value = 0;

    friend bool operator==(const TransferKey&, const TransferKey&) = default;
};

// Correlation key pair scoping one OS operation to one connection.
//
// Pairs are minted by the callback translation layer from CF_CALLBACK_INFO; provider code only
// ever receives them. A pair stays unique until the operation it names is resolved.
// requestKey is the CF_REQUEST_KEY echoed back to CfExecute. It is carried alongside the pair
// but does not take part in its identity.
struct CorrelationKeyPair
{
    ConnectionKey connection;
    TransferKey transfer;
    int64_t requestKey = 0;

    friend bool operator==(const CorrelationKeyPair& a, const CorrelationKeyPair& b) noexcept
    {
        return a.connection == b.connection && a.transfer == b.transfer;
    }
};

struct CorrelationKeyPairHash
{
    size_t operator()(const CorrelationKeyPair& keys) const noexcept
    {
        const size_t h1 = std::hash<int64_t>{}(keys.connection.value);
        const size_t h2 = std::hash<int64_t>{}(keys.transfer.value);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ull + (h1 << 6) + (h1 >> 2));
    }
};
} // namespace CloudSync
