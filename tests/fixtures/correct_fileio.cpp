// File I/O variant of correct_stdio: input.txt -> output.txt
#include <cstdint>
#include <fstream>

int main() {
    std::ifstream input{"input.txt"};
    std::int64_t value{};

    if (!(input >> value)) {
        return 1;
    }

    std::ofstream output{"output.txt"};
    output << "correct " << value << '\n';

    return output ? 0 : 1;
}
