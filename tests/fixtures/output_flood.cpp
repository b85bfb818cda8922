// Writes without end
#include <cstdio>
#include <string>

int main() {
    const std::string line(1023, 'x');

    std::fputs("correct ", stdout);

    while (true) {
        std::puts(line.c_str());
    }
}
