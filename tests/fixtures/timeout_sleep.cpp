// Blocks forever without using any CPU
#include <unistd.h>

int main() {
    while (true) {
        pause();
    }
}
