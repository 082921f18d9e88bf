#include "loom/IR.hpp"

namespace loom {
namespace ir {

const Argument* Directive::findArgument(const std::string& argumentName) const {
    for (const auto& argument : arguments) {
        if (argument.name == argumentName) { return &argument; }
    }
    return nullptr;
}

bool Selection::hasDirective(const std::string& directiveName) const {
    for (const auto& directive : directives) {
        if (directive.name == directiveName) { return true; }
    }
    return false;
}

} // namespace ir
} // namespace loom
