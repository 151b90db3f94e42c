/**
 * Key Builder Example
 *
 * This example demonstrates how to:
 * 1. Build an object key from untrusted fragments
 * 2. Extend a key one component at a time
 * 3. Parse a '/'-delimited key
 * 4. Borrow a key without copying it
 */

#include <iostream>
#include <string>
#include <vector>

#include "objkey/key/key_path.h"

using objkey::key::KeyPath;
using objkey::key::KeyPathView;
using namespace std;

namespace {

void PrintError(const string& what, const objkey::core::Error& error) {
    cerr << what << " failed: " << error.message << endl;
}

}  // namespace

int main(int argc, char** argv) {
    // Pretend the tenant and file name came from a request.
    const string tenant = argc > 1 ? argv[1] : "acme";
    const string file_name = argc > 2 ? argv[2] : "report-2024.pdf";

    auto key = KeyPath::Of("tenants", tenant, "uploads");
    if (!key.ok()) {
        PrintError("building prefix", key.error());
        return 1;
    }

    auto joined = key.value().Join(file_name);
    if (!joined.ok()) {
        PrintError("adding file name", joined.error());
        return 1;
    }
    cout << "object key: " << key.value() << endl;
    cout << "local path: " << key.value().ResolveUnder("/var/lib/objects").string() << endl;

    // Delimited input is split once; every piece must still be a valid component.
    for (const string input : {"tenants/acme/../../etc/passwd", "tenants//acme", "a/b/c"}) {
        auto parsed = KeyPath::FromDelimited(input);
        if (parsed.ok()) {
            cout << input << " -> ok" << endl;
        } else {
            cout << input << " -> " << objkey::core::ErrorCodeName(parsed.error().code) << endl;
        }
    }

    // A view borrows the owner's strings and can be copied back out at any time.
    KeyPathView view = key.value().AsView();
    KeyPath copy = view.ToOwned();
    cout << "view == copy: " << boolalpha << (view == copy) << endl;
    return 0;
}
