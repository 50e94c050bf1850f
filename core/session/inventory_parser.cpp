#include "session/inventory_parser.hpp"
#include "session/text_utils.hpp"

namespace tale {

std::string parseItemName(const std::string& descriptor) {
    std::string lower = text::toLower(descriptor);

    size_t parent = lower.find("parent");
    if (parent != std::string::npos) {
        std::string name = text::trim(descriptor.substr(0, parent));
        size_t colon = name.find(':');
        if (colon != std::string::npos) {
            name = text::trim(name.substr(colon + 1));
        }
        return name;
    }

    size_t colon = descriptor.find(':');
    if (colon != std::string::npos) {
        return text::trim(descriptor.substr(colon + 1));
    }

    return descriptor;
}

std::vector<std::string> parseInventory(const std::vector<std::string>& descriptors) {
    std::vector<std::string> names;
    names.reserve(descriptors.size());
    for (const auto& d : descriptors) {
        names.push_back(parseItemName(d));
    }
    return names;
}

} // namespace tale
