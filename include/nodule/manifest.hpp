#pragma once

#include <nodule/result.hpp>
#include <nodule/dependency.hpp>
#include <string>

namespace nodule {

// package.json, reduced to what an install needs
struct Manifest {
    std::string name;
    std::string version;
    DependencyMap dependencies;   // empty when the section is absent

    static Result<Manifest> parse(const std::string& json_text,
                                  const std::string& origin = "");
    static Result<Manifest> load(const std::string& path);
};

} // namespace nodule
