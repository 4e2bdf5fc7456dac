#include <adnet/adnet.hpp>
#include <iostream>

using namespace adnet;

int main() {
    std::cout << "=== Simple Gradient Computation ===" << std::endl;

    Tape tape;

    // Leaves
    Var x = tape.constant(2.0);
    Var y = tape.constant(3.0);

    // z = x * y + x^2 + exp(-y)
    Var z = x * y + x * x + exp(-y);

    std::cout << "x = 2, y = 3" << std::endl;
    std::cout << "z = x * y + x^2 + exp(-y) = " << z.value() << std::endl;
    std::cout << "nodes on tape: " << tape.size() << std::endl;

    // Compute gradients
    tape.reset_trace(z);
    tape.reverse_trace(z, 1.0);

    std::cout << "\nGradients:" << std::endl;
    std::cout << "dz/dx = " << x.adjoint() << std::endl;
    std::cout << "dz/dy = " << y.adjoint() << std::endl;

    // Analytical: dz/dx = y + 2x = 7
    //             dz/dy = x - exp(-y) = 2 - 0.0498

    return 0;
}
