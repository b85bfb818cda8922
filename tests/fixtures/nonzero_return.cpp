// Prints a correct answer, then exits with a failure code
#include <cstdint>
#include <iostream>

int main() {
    std::int64_t value{};

    if (!(std::cin >> value)) {
        return 1;
    }

    std::cout << "correct " << value << '\n';

    return 3;
}
