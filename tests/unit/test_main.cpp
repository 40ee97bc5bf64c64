#include <gtest/gtest.h>
#include <Vectorama/Vectorama.h>

#include <iostream>

int main(int argc, char** argv) {
    // Print library info
    std::cout << "========================================\n";
    std::cout << "Vectorama Unit Tests\n";
    std::cout << "Version: " << Vectorama::GetVersion() << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
