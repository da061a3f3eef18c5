#include "assembler.hpp"

#include <sstream>
#include <unordered_set>

namespace pseudo_mt {
namespace {

bool is_import_line(const std::string& line) {
    if (line.starts_with("import ")) {
        return true;
    }
    return line.starts_with("from ") && line.find(" import ") != std::string::npos;
}

std::string rtrim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.pop_back();
    }
    return s;
}

}  // namespace

std::string BasicAssembler::assemble(const std::vector<Block>& blocks) const {
    std::vector<std::string> imports;
    std::unordered_set<std::string> seen_imports;
    std::vector<std::string> bodies;

    for (const auto& block : blocks) {
        std::istringstream in(block.content);
        std::string line;
        std::string body;

        while (std::getline(in, line)) {
            line = rtrim(std::move(line));
            // Only module-level imports are hoisted; indented ones stay in place.
            if (is_import_line(line)) {
                if (seen_imports.insert(line).second) {
                    imports.push_back(line);
                }
                continue;
            }
            body += line;
            body.push_back('\n');
        }

        body = rtrim(std::move(body));
        if (!body.empty()) {
            bodies.push_back(std::move(body));
        }
    }

    std::string out;
    for (const auto& import_line : imports) {
        out += import_line;
        out.push_back('\n');
    }
    if (!imports.empty() && !bodies.empty()) {
        out.push_back('\n');
    }

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        if (i > 0) {
            out += "\n\n";
        }
        out += bodies[i];
    }
    if (!out.empty() && out.back() != '\n') {
        out.push_back('\n');
    }
    return out;
}

}  // namespace pseudo_mt
