// EN: Entry point of the arealint command line tool.
// FR: Point d'entrée de l'outil en ligne de commande arealint.

#include <iostream>

#include "app/application.hpp"
#include "infrastructure/logging/logger.hpp"

int main(int argc, char* argv[]) {
    ARL::App::Application application(std::cout, std::cerr);
    const int exit_code = application.run(argc, argv);
    ARL::Logger::getInstance().flush();
    return exit_code;
}
