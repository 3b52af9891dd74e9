#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"

// Entry point shared by every test file in this directory.
int main(int argc, char** argv) {
    return doctest::Context(argc, argv).run();
}
