/**
 * @file DigestSink.cpp
 * @brief DigestSink implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/sink/DigestSink.hpp>

#include <format>

namespace plr::sink {

DigestSink::DigestSink(std::ostream& out)
    : _out{out}
{
}

core::ExpectedVoid DigestSink::consume(canvas::Snapshot snapshot)
{
    const auto& label = snapshot.label();
    _out << std::format("{} {} {:016x}\n", label.timestamp, label.index, snapshot.digest());
    if (!_out)
    {
        return core::makeError(core::ErrorCode::kSinkFailed, "digest output stream failed");
    }
    return {};
}

core::ExpectedVoid DigestSink::finish()
{
    _out.flush();
    if (!_out)
    {
        return core::makeError(core::ErrorCode::kSinkFailed, "digest output stream failed");
    }
    return {};
}

} // namespace plr::sink
