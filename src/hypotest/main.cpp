#include <iostream>
#include "CommandLineApp.h"

int main(int argc, char** argv)
{
    hypotest::CommandLineApp app;
    return app.run(argc, argv, std::cout, std::cerr);
}
