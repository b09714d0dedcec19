#pragma once

#include <string>
#include <vector>

namespace scriptbox::sandbox {

// How to launch an interpreter on a script file. The script path is
// appended after args.
struct InterpreterCommand {
    std::string language;
    std::string executable;
    std::vector<std::string> args;
    std::string file_extension;
    std::string display_name;
    std::string install_hint;

    std::string NotFoundMessage() const {
        return display_name + " not found." + (install_hint.empty() ? "" : " " + install_hint);
    }
};

}  // namespace scriptbox::sandbox
