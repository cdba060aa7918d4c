#include <tokwh/assert_test.h>

#include <tokwh/Pl_SHA256.hh>
#include <tokwh/Pl_String.hh>

#include <iostream>
#include <stdexcept>

static std::string
digest(std::string const& data)
{
    Pl_SHA256 p;
    p.writeString(data);
    p.finish();
    return p.getHexDigest();
}

int
main()
{
    assert(
        digest("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(digest("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    // Data is passed through to the next pipeline and the pipeline can be reused.
    std::string copy;
    Pl_String s("copy", nullptr, copy);
    Pl_SHA256 p(&s);
    p.writeString("a");
    p.writeString("bc");
    try {
        p.getHexDigest();
        assert(false);
    } catch (std::logic_error&) {
    }
    p.finish();
    assert(copy == "abc");
    assert(p.getHexDigest() == digest("abc"));
    assert(p.getRawDigest().size() == 32);
    p.finish();
    assert(p.getHexDigest() == digest(""));

    std::cout << "sha256 tests done" << std::endl;
    return 0;
}
