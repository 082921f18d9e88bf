#ifndef SRC_LOOM_PRINTER_HPP_
#define SRC_LOOM_PRINTER_HPP_

#include "loom/IR.hpp"

#include <string>

namespace loom {

class Program;

// Prints IR back to canonical GraphQL text with two space indentation.
class Printer {
public:
    Printer() = delete;

    static std::string printDefinition(const ir::Definition& definition);
    // The text sent to the server for |operationName|: the operation followed by every fragment it reaches in
    // |program|, sorted by name. Returns an empty string if there's no such operation.
    static std::string printOperationText(const Program& program, const std::string& operationName);

    static std::string printValue(const ir::Value& value);

private:
    static void printSelections(const ir::Selections& selections, int indent, std::string& out);
    static void printDirectives(const std::vector<ir::Directive>& directives, std::string& out);
    static void printArguments(const std::vector<ir::Argument>& arguments, std::string& out);
};

} // namespace loom

#endif // SRC_LOOM_PRINTER_HPP_
