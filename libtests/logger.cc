#include <tokwh/assert_test.h>

#include <tokwh/Pl_String.hh>
#include <tokwh/TWLogger.hh>

#include <iostream>
#include <sstream>
#include <stdexcept>

static void
test_channels()
{
    auto l = TWLogger::create();
    std::string info;
    std::string err;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setError(std::make_shared<Pl_String>("error", nullptr, err));
    l->info("one\n");
    l->warn(std::string("two\n"));
    l->error("three\n");
    assert(info == "one\n");
    // warn follows error until it is set
    assert(err == "two\nthree\n");

    std::string warn;
    l->setWarn(std::make_shared<Pl_String>("warn", nullptr, warn));
    l->setPrefix("tokwh: ");
    l->warn("four\n");
    assert(warn == "tokwh: four\n");
    assert(err == "two\nthree\n");
    assert(l->getPrefix() == "tokwh: ");

    l->setWarn(l->discard());
    l->warn("gone\n");
    assert(warn == "tokwh: four\n");

    // Resetting to null restores the defaults.
    l->setInfo(nullptr);
    assert(l->getInfo() == l->standardOutput());
    l->setWarn(nullptr);
    assert(l->getWarn() == l->getError());
}

static void
test_streams()
{
    auto l = TWLogger::create();
    std::ostringstream out;
    std::ostringstream err;
    l->setOutputStreams(&out, &err);
    l->info("to out\n");
    l->warn("to err\n");
    l->getInfo()->finish();
    l->getError()->finish();
    assert(out.str() == "to out\n");
    assert(err.str() == "to err\n");

    l->setOutputStreams(nullptr, nullptr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
}

static void
test_default()
{
    auto l1 = TWLogger::defaultLogger();
    auto l2 = TWLogger::defaultLogger();
    assert(l1 == l2);
    assert(l1 != TWLogger::create());
}

int
main()
{
    test_channels();
    test_streams();
    test_default();
    std::cout << "logger tests done" << std::endl;
    return 0;
}
