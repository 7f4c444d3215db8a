#include "app/DnaGraphApp.hpp"

int main(int argc, char** argv) {
    dnagraph::app::DnaGraphApp app(argc, argv);
    return app.Run();
}
