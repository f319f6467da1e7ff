#include "infrastructure/FilePoolSource.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pda::infrastructure {

FilePoolSource::FilePoolSource(std::string path) : path_(std::move(path)) {}

std::vector<domain::RawPool> FilePoolSource::fetch_pools() {
    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error("Cannot open pool file: " + path_);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parser_.parse(buffer.str());
}

} // namespace pda::infrastructure
