// File I/O variant of half_correct_stdio
#include <cstdint>
#include <fstream>

int main() {
    std::ifstream input{"input.txt"};
    std::int64_t value{};

    if (!(input >> value)) {
        return 1;
    }

    std::ofstream output{"output.txt"};
    output << "correct " << (value % 2 == 0 ? value : 0) << '\n';

    return output ? 0 : 1;
}
