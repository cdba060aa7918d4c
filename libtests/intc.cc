#include <tokwh/assert_test.h>

#include <tokwh/TWIntC.hh>

#include <cstdint>
#include <iostream>

#define try_convert(exp_pass, fn, i) try_convert_real(#fn "(" #i ")", exp_pass, fn, i)

template <typename From, typename To>
static void
try_convert_real(char const* description, bool exp_pass, To (*fn)(From const&), From const& i)
{
    bool passed = false;
    try {
        To result = fn(i);
        passed = true;
        std::cout << description << ": " << +i << " " << +result;
    } catch (std::range_error& e) {
        std::cout << description << ": " << e.what();
        passed = false;
    }
    std::cout << ((passed == exp_pass) ? " PASSED" : " FAILED") << std::endl;
    assert(passed == exp_pass);
}

int
main()
{
    uint32_t u1 = 3141592653U;
    int32_t i1 = -1153374643;
    int i2 = 1;
    uint64_t ul1 = 1099511627776LL;
    int64_t il1 = -1099511627776LL;
    long long ll1 = 1000000;
    size_t s1 = 12;

    try_convert(true, TWIntC::to_int<int32_t>, i1);
    try_convert(true, TWIntC::to_uint<uint32_t>, u1);
    try_convert(false, TWIntC::to_int<uint32_t>, u1);
    try_convert(false, TWIntC::to_uint<int32_t>, i1);
    try_convert(true, TWIntC::to_size<int>, i2);
    try_convert(false, TWIntC::to_size<int64_t>, il1);
    try_convert(false, TWIntC::to_uint32<uint64_t>, ul1);
    try_convert(true, TWIntC::to_longlong<uint64_t>, ul1);
    try_convert(true, TWIntC::to_longlong<size_t>, s1);
    try_convert(true, TWIntC::to_ulonglong<long long>, ll1);
    try_convert(false, TWIntC::to_ulonglong<int64_t>, il1);
    try_convert(false, TWIntC::to_longlong<uint64_t>, UINT64_MAX);

    assert(TWIntC::clamp(-100, 0, 10) == 0);
    assert(TWIntC::clamp(5, 0, 10) == 5);
    assert(TWIntC::clamp(2'000'000, 0, 1'000'000) == 1'000'000);
    return 0;
}
