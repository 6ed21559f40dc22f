#include "kookbridge/cli/app.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        kookbridge::cli::App app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "kookbridge: " << e.what() << "\n";
        return 1;
    }
}
