#include <tokwh/Pl_Discard.hh>
#include <tokwh/ReferenceCollectors.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TWJSONNode.hh>
#include <tokwh/TWLogger.hh>
#include <tokwh/TokenWarehouse.hh>

#include <iostream>
#include <stdexcept>

class FuzzHelper
{
  public:
    FuzzHelper(unsigned char const* data, size_t size);
    void run();

  private:
    void doChecks();

    unsigned char const* data;
    size_t size;
};

FuzzHelper::FuzzHelper(unsigned char const* data, size_t size) :
    data(data),
    size(size)
{
}

void
FuzzHelper::doChecks()
{
    auto nodes =
        TWJSONNode::parseDocument(std::string(reinterpret_cast<char const*>(data), size));

    // Small limits keep individual runs fast.
    TWConfig config;
    config.setMaxTokens(20'000).setMaxNesting(200).setMaxItems("links", 500);
    auto logger = TWLogger::create();
    logger->setWarn(logger->discard());

    TokenWarehouse w(nodes, config, "", logger);
    for (auto const& c: tokwh::makeReferenceCollectors(config)) {
        w.registerCollector(c);
    }
    w.dispatchAll();
    auto results = w.finalizeAll();
    Pl_Discard discard;
    TokenWarehouse::resultsToJSON(results).write(&discard);
    for (long long line = -2; line < w.lineCount() + 2; ++line) {
        w.sectionOf(line);
    }
}

void
FuzzHelper::run()
{
    try {
        doChecks();
    } catch (TWExc const& e) {
        std::cerr << "TWExc: " << e.what() << '\n';
    }
}

extern "C" int
LLVMFuzzerTestOneInput(unsigned char const* data, size_t size)
{
    FuzzHelper f(data, size);
    f.run();
    return 0;
}
