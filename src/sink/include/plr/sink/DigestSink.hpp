/**
 * @file DigestSink.hpp
 * @brief Sink printing one "<timestamp> <index> <digest>" line per snapshot.
 *
 * Lets two runs be compared for determinism without writing images.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_SINK_DIGESTSINK_HPP
    #define PLR_SINK_DIGESTSINK_HPP

#include <plr/replay/ISnapshotSink.hpp>

#include <ostream>

namespace plr::sink {

class DigestSink final : public replay::ISnapshotSink
{
public:
    explicit DigestSink(std::ostream& out);

    [[nodiscard]] core::ExpectedVoid consume(canvas::Snapshot snapshot) override;
    [[nodiscard]] core::ExpectedVoid finish() override;

private:
    std::ostream& _out;
};

} // namespace plr::sink

#endif // PLR_SINK_DIGESTSINK_HPP
