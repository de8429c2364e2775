#pragma once

#include <string>

struct Session;

// Replaces $NAME, ${NAME} and $? across a whole line. Single-quoted text and
// backslash-escaped dollars are left alone; anything that is not a valid
// reference stays literal.
class VariableExpander {
   public:
    explicit VariableExpander(const Session& session);

    std::string expand(const std::string& line) const;

    std::string get_variable_value(const std::string& var_name) const;

   private:
    const Session& session_;
};
