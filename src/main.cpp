#include "chatstore/cli/app.hpp"

int main(int argc, char** argv) {
    chatstore::cli::App app;
    return app.run(argc, argv);
}
