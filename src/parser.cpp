#include "kiln/parser.hpp"

#include <memory>
#include <string_view>

namespace kiln {

std::unique_ptr<ParserAdapter> make_adapter(std::string_view name, AnalyzerOptions options) {
    if (name == "tree")
        return make_tree_adapter(std::move(options));
    if (name == "stream")
        return make_stream_adapter(std::move(options));
    return nullptr;
}

const std::vector<std::string_view> &adapter_names() {
    static const std::vector<std::string_view> names = {"tree", "stream"};
    return names;
}

} // namespace kiln
