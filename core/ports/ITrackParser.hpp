#pragma once

#include "../Track.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sailtrack::ports {

// One implementation per source format. parse() never throws: failures are
// reported through TrackImportResult::errors.
class ITrackParser {
public:
    virtual ~ITrackParser() = default;

    virtual SourceFormat format() const = 0;
    virtual bool requiresBinary() const = 0;

    virtual TrackImportResult parse(const std::vector<std::uint8_t>& data,
                                    const std::string& sourceName) const = 0;
};

} // namespace sailtrack::ports
