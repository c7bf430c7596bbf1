#include <catch2/catch.hpp>

#include "core/CancellationToken.hpp"
#include "core/Errors.hpp"

#include <csignal>

using namespace opendem;

TEST_CASE("token raises only once cancelled", "[cancel]")
{
    CancellationToken token;
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE_NOTHROW(token.throw_if_cancelled("decode"));

    token.cancel();
    REQUIRE(token.is_cancelled());
    try {
        token.throw_if_cancelled("decode");
        FAIL("throw_if_cancelled() should have thrown");
    } catch (OperationCancelled const &e) {
        REQUIRE(e.get_stage() == "decode");
    }
}

TEST_CASE("waiting ends early on a cancelled token", "[cancel]")
{
    CancellationToken token;
    REQUIRE(token.wait_for(std::chrono::milliseconds(1)));

    token.cancel();
    REQUIRE_FALSE(token.wait_for(std::chrono::milliseconds(10000)));
}

TEST_CASE("SIGINT cancels the installed token", "[cancel]")
{
    CancellationToken token;
    {
        InterruptHandler handler{token};
        handler.install_handlers();
        std::raise(SIGINT);
        REQUIRE(token.is_cancelled());
    }
}
