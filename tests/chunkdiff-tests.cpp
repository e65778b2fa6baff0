#include <boost/throw_exception.hpp>
#include "boost-unit-test.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <gmock/gmock.h>

#include <spdlog/spdlog.h>

#if defined BOOST_COMP_GNUC_AVAILABLE
#pragma GCC diagnostic ignored "-Wmissing-declarations"
#endif

using namespace boost::unit_test;

class HookupListner : public ::testing::EmptyTestEventListener
{
public:
    void OnTestPartResult(const ::testing::TestPartResult &result)
    {
        boost::unit_test::unit_test_log
                << boost::unit_test::log::begin(result.file_name(),
                                                result.line_number())
                << boost::unit_test::log_all_errors << result.summary()
                << boost::unit_test::log::end();
        boost::unit_test::framework::assertion_result(
                result.passed() ? boost::unit_test::AR_PASSED
                                : boost::unit_test::AR_FAILED);
    }
};
// OpenSSL allocates its thread local error queue on first use which yields
// false positive memory leaks, therefore it is initialized before the leak
// detector takes its baseline snapshot
struct OpenSslFixture
{
    OpenSslFixture()
    {
        OPENSSL_init_crypto(0, nullptr);
        ERR_clear_error();
    }
};
OpenSslFixture OpenSslInitializer;

bool init_unit_test()
{
    auto &suite{boost::unit_test::framework::master_test_suite()};
    ::testing::InitGoogleMock(&suite.argc, suite.argv);

    // hook up the gmock and boost test
    auto &listeners{::testing::UnitTest::GetInstance()->listeners()};
    delete listeners.Release(listeners.default_result_printer());
    listeners.Append(new HookupListner);

    spdlog::set_level(spdlog::level::warn);

    framework::master_test_suite().p_name.value = "chunkdiff test suite";
    return true;
}

// this way we don't have to care about whether Boost.Test was compiled with
// BOOST_TEST_ALTERNATIVE_INIT_API defined or not.
test_suite *init_unit_test_suite(int /*argc*/, char * /*argv*/[])
{
    if (!init_unit_test())
    {
        BOOST_THROW_EXCEPTION(framework::setup_error("init_unit_test failed."));
    }
    return nullptr;
}
