// Reads "<mode> <target>" from stdin and tries to reach the target:
//   write <path>    overwrite a file
//   read <path>     read a file
//   symlink <path>  link to a file from the working directory, then write through the link
//   signal <pid>    send signal 0 to a process
// Prints "correct 1" if the attempt succeeded, exits with 2 otherwise
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include <sys/types.h>
#include <unistd.h>

namespace {

bool write_to(const std::string& path) {
    std::ofstream file{path};
    file << "tampered\n";
    return static_cast<bool>(file);
}

bool read_from(const std::string& path) {
    std::ifstream file{path};
    std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    return file.is_open();
}

} // namespace

int main() {
    std::string mode;
    std::string target;

    if (!(std::cin >> mode >> target)) {
        return 1;
    }

    bool ok = false;

    if (mode == "write") {
        ok = write_to(target);
    } else if (mode == "read") {
        ok = read_from(target);
    } else if (mode == "symlink") {
        ok = ::symlink(target.c_str(), "link") == 0 && write_to("link");
    } else if (mode == "signal") {
        ok = ::kill(static_cast<pid_t>(std::stol(target)), 0) == 0;
    } else {
        return 1;
    }

    if (!ok) {
        return 2;
    }

    std::cout << "correct 1\n";
}
