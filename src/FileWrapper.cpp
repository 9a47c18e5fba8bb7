#include "../include/FileWrapper.hpp"
#include "../include/Console.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace tekton;

bool LocalFileWrapper::exists(const std::string &path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string LocalFileWrapper::read_all_text(const std::string &path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error(std::string(_("Failed to open file: ")) + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
