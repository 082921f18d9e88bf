#include "loom/Printer.hpp"

#include "loom/Program.hpp"

#include "fmt/format.h"

#include <set>

namespace {

std::string escapeString(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size() + 2);
    escaped += '"';
    for (char c : text) {
        switch (c) {
        case '"': escaped += "\\\""; break;
        case '\\': escaped += "\\\\"; break;
        case '\b': escaped += "\\b"; break;
        case '\f': escaped += "\\f"; break;
        case '\n': escaped += "\\n"; break;
        case '\r': escaped += "\\r"; break;
        case '\t': escaped += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                escaped += fmt::format("\\u{:04x}", static_cast<int>(c));
            } else {
                escaped += c;
            }
            break;
        }
    }
    escaped += '"';
    return escaped;
}

} // namespace

namespace loom {

// static
std::string Printer::printDefinition(const ir::Definition& definition) {
    std::string out;
    if (definition.isOperation()) {
        out += fmt::format("{} {}", operationKindName(definition.operationKind), definition.name);
        if (!definition.variables.empty()) {
            out += '(';
            bool first = true;
            for (const auto& variable : definition.variables) {
                if (!first) { out += ", "; }
                first = false;
                out += fmt::format("${}: {}", variable.name, variable.type.toString());
                if (variable.defaultValue) {
                    out += " = ";
                    out += printValue(*variable.defaultValue);
                }
            }
            out += ')';
        }
    } else {
        out += fmt::format("fragment {} on {}", definition.name, definition.typeCondition);
    }
    printDirectives(definition.directives, out);
    out += " {\n";
    printSelections(definition.selections, 1, out);
    out += "}\n";
    return out;
}

// static
std::string Printer::printOperationText(const Program& program, const std::string& operationName) {
    const auto* operation = program.findOperation(operationName);
    if (!operation) { return std::string(); }

    std::set<std::string> fragmentNames;
    std::vector<std::string> pending;
    ir::forEachFragmentSpread(operation->selections,
            [&pending](const std::string& spreadName) { pending.emplace_back(spreadName); });
    while (!pending.empty()) {
        auto name = std::move(pending.back());
        pending.pop_back();
        if (!fragmentNames.insert(name).second) { continue; }
        const auto* fragment = program.findFragment(name);
        if (!fragment) { continue; }
        ir::forEachFragmentSpread(fragment->selections,
                [&pending](const std::string& spreadName) { pending.emplace_back(spreadName); });
    }

    std::string text = printDefinition(*operation);
    for (const auto& name : fragmentNames) {
        const auto* fragment = program.findFragment(name);
        if (!fragment) { continue; }
        text += '\n';
        text += printDefinition(*fragment);
    }
    return text;
}

// static
std::string Printer::printValue(const ir::Value& value) {
    switch (value.kind) {
    case ir::Value::Kind::kVariable:
        return fmt::format("${}", value.text);
    case ir::Value::Kind::kString:
        return escapeString(value.text);
    case ir::Value::Kind::kNull:
        return "null";
    case ir::Value::Kind::kInt:
    case ir::Value::Kind::kFloat:
    case ir::Value::Kind::kBoolean:
    case ir::Value::Kind::kEnum:
        return value.text;
    case ir::Value::Kind::kList: {
        std::string out = "[";
        for (size_t i = 0; i < value.items.size(); ++i) {
            if (i > 0) { out += ", "; }
            out += printValue(value.items[i]);
        }
        out += ']';
        return out;
    }
    case ir::Value::Kind::kObject: {
        std::string out = "{";
        for (size_t i = 0; i < value.items.size(); ++i) {
            if (i > 0) { out += ", "; }
            out += fmt::format("{}: {}", value.fieldNames[i], printValue(value.items[i]));
        }
        out += '}';
        return out;
    }
    }
    return std::string();
}

// static
void Printer::printSelections(const ir::Selections& selections, int indent, std::string& out) {
    std::string padding(static_cast<size_t>(indent) * 2, ' ');
    for (const auto& selection : selections) {
        out += padding;
        switch (selection->kind) {
        case ir::SelectionKind::kScalarField:
        case ir::SelectionKind::kLinkedField: {
            const auto* field = static_cast<const ir::Field*>(selection.get());
            if (!field->alias.empty()) {
                out += fmt::format("{}: ", field->alias);
            }
            out += field->name;
            printArguments(field->arguments, out);
            printDirectives(field->directives, out);
            if (selection->kind == ir::SelectionKind::kLinkedField) {
                out += " {\n";
                printSelections(static_cast<const ir::LinkedField*>(field)->selections, indent + 1, out);
                out += padding;
                out += '}';
            }
        } break;

        case ir::SelectionKind::kFragmentSpread:
            out += fmt::format("...{}", static_cast<const ir::FragmentSpread*>(selection.get())->fragmentName);
            printDirectives(selection->directives, out);
            break;

        case ir::SelectionKind::kInlineFragment: {
            const auto* inlineFragment = static_cast<const ir::InlineFragment*>(selection.get());
            out += "...";
            if (!inlineFragment->typeCondition.empty()) {
                out += fmt::format(" on {}", inlineFragment->typeCondition);
            }
            printDirectives(inlineFragment->directives, out);
            out += " {\n";
            printSelections(inlineFragment->selections, indent + 1, out);
            out += padding;
            out += '}';
        } break;
        }
        out += '\n';
    }
}

// static
void Printer::printDirectives(const std::vector<ir::Directive>& directives, std::string& out) {
    for (const auto& directive : directives) {
        out += fmt::format(" @{}", directive.name);
        printArguments(directive.arguments, out);
    }
}

// static
void Printer::printArguments(const std::vector<ir::Argument>& arguments, std::string& out) {
    if (arguments.empty()) { return; }
    out += '(';
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) { out += ", "; }
        out += fmt::format("{}: {}", arguments[i].name, printValue(arguments[i].value));
    }
    out += ')';
}

} // namespace loom
