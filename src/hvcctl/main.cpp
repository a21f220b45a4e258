// EN: hvcctl entry point.
// FR: Point d'entrée de hvcctl.

#include <exception>
#include <iostream>

#include "app/cleanup_app.hpp"

int main(int argc, char* argv[]) {
    try {
        HVC::App::CleanupApplication app(std::cin, std::cout, std::cerr);
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "hvcctl: fatal: " << e.what() << std::endl;
        return HVC::App::ToInt(HVC::App::ExitCode::kPreconditionFailure);
    }
}
