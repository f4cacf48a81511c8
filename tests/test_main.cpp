#include <gtest/gtest.h>
#include <sodium.h>

// libsodium must be initialised before randombytes / generichash are used
class SodiumEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        ASSERT_GE(sodium_init(), 0);
    }
};

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new SodiumEnvironment);
    return RUN_ALL_TESTS();
}
