#include "vfs/source_ref.hpp"

#include <regex>

namespace tvfs::vfs {

namespace {

constexpr std::string_view SCHEME = "plugin://";

const std::regex& plugin_notebook_re() {
    static const std::regex re(R"(^plugin://plugin-(.*)/notebooks/(.*)\.(md|json)$)");
    return re;
}

const std::regex& client_notebook_re() {
    static const std::regex re(
        R"(^plugin://client/notebooks/(.*)\.(md|json|yml|yaml|txt|py)$)");
    return re;
}

const std::regex& client_file_re() {
    static const std::regex re(R"(^plugin://client/(.*)\.(md|json)$)");
    return re;
}

} // namespace

std::string SourceRef::bundle_path() const {
    return src_filepath.substr(SCHEME.size());
}

std::optional<SourceRef> parse_source_ref(std::string_view src_filepath) {
    std::string src(src_filepath);
    std::smatch m;

    SourceRef ref;
    ref.src_filepath = src;

    // Checked in order; the first matching shape wins
    if (std::regex_match(src, m, plugin_notebook_re())) {
        ref.plugin = m[1].str();
        ref.file = m[2].str();
        ref.extension = m[3].str();
    } else if (std::regex_match(src, m, client_notebook_re())) {
        ref.file = m[1].str();
        ref.extension = m[2].str();
    } else if (std::regex_match(src, m, client_file_re())) {
        ref.file = m[1].str();
        ref.extension = m[2].str();
    } else {
        return std::nullopt;
    }

    if (ref.file.empty()) {
        return std::nullopt;
    }
    return ref;
}

std::string client_notebook_source(std::string_view stem,
                                   std::string_view extension) {
    std::string result(SCHEME);
    result += "client/notebooks/";
    result += stem;
    result += '.';
    result += extension;
    return result;
}

} // namespace tvfs::vfs
