// Terminates cleanly, but with a label no checker accepts
#include <cstdint>
#include <iostream>

int main() {
    std::int64_t value{};

    if (!(std::cin >> value)) {
        return 1;
    }

    std::cout << "incorrect " << value << '\n';
}
