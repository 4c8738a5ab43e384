#include "app/SymbolGateApp.hpp"

int main(int argc, char** argv) {
    symbolgate::app::SymbolGateApp app;
    return app.Run(argc, argv);
}
