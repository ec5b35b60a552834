#include "JsonExporter.hpp"
#include "../JsonCodec.hpp"

namespace sailtrack::exporters {

std::string JsonExporter::render(const Track& track) const {
    return JsonCodec::serialize(track, indent_) + "\n";
}

} // namespace sailtrack::exporters
