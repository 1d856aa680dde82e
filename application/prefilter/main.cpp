#include <prereader/app.hpp>

int main(int argc, char** argv) {
    return prereader::App{}.run(argc, argv);
}
