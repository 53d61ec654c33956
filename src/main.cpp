#include "hostmon/application.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    hostmon::Application app(std::cout, std::cerr);
    return app.run(args, argc > 0 ? argv[0] : "hostmon");
}
