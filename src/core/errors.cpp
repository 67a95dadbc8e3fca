#include "nectar/core/errors.hpp"

namespace nectar::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::Unknown: return "unknown";
        case StatusCode::Invalid: return "invalid argument";
        case StatusCode::NotFound: return "not found";
        case StatusCode::Conflict: return "invalid state";
        case StatusCode::Corrupt: return "corrupt data";
        case StatusCode::Io: return "io error";
        case StatusCode::Crypto: return "crypto error";
        case StatusCode::Unsupported: return "unsupported";
        case StatusCode::Unavailable: return "unavailable";
        case StatusCode::Overflow: return "arithmetic overflow";
        case StatusCode::SizeExceeded: return "size exceeded";
        case StatusCode::InsufficientData: return "insufficient data";
        case StatusCode::MissingField: return "missing field";
        case StatusCode::OutOfOrder: return "field out of order";
        case StatusCode::InvalidBucketDepth: return "invalid bucket depth";
        case StatusCode::ZeroDuration: return "zero duration";
        case StatusCode::ZeroBlockTime: return "zero block time";
        case StatusCode::AddressMismatch: return "address mismatch";
        case StatusCode::Expired: return "expired";
        case StatusCode::StampUsed: return "stamp already used";
        case StatusCode::InvalidStampIndex: return "invalid stamp index";
        case StatusCode::CapacityExceeded: return "capacity exceeded";
        case StatusCode::BucketFull: return "bucket full";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "core";
        case StatusDomain::Chunk: return "chunk";
        case StatusDomain::Postage: return "postage";
        case StatusDomain::Auth: return "auth";
        case StatusDomain::Crypto: return "crypto";
        case StatusDomain::Db: return "db";
        case StatusDomain::Cli: return "cli";
        case StatusDomain::External: return "external";
        }
        return "unknown";
    }
} // namespace nectar::core
