// Echoes the input value with the "correct" label
#include <cstdint>
#include <iostream>

int main() {
    std::int64_t value{};

    if (!(std::cin >> value)) {
        return 1;
    }

    std::cout << "correct " << value << '\n';
}
