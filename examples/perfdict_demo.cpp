/**
 * @file perfdict_demo.cpp
 * @brief Walk-through of perfect_map behaviour, including its sharp edges
 */

#include <perfdict/perfdict.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace perfdict;

namespace {

void show(const perfect_map<int>& m, std::string_view key) {
    std::cout << "  get(\"" << key << "\") -> ";
    if (auto v = m.get(key)) {
        std::cout << *v << "\n";
    } else {
        std::cout << "error: " << error_message(v.error()) << "\n";
    }
}

} // namespace

int main() {
    std::cout << "=== perfdict demo ===\n\n";

    // 1. Fingerprints disabled: every key is accepted
    std::cout << "1. Without fingerprints\n";
    auto plain = perfect_map<int>::build(
        {{"alice", 1}, {"bob", 2}, {"carol", 3}},
        {.fingerprint_bits = 0});
    if (!plain) {
        std::cerr << "build failed: " << error_message(plain.error()) << "\n";
        return 1;
    }
    show(*plain, "alice");
    show(*plain, "bob");
    show(*plain, "dave");   // Not a build key; reads some slot's value
    std::cout << "  contains(\"dave\") -> " << std::boolalpha << plain->contains("dave") << "\n\n";

    // 2. Fingerprints enabled: absent keys are (almost always) rejected
    std::cout << "2. With 16-bit fingerprints\n";
    auto checked = perfect_map<int>::build({{"alice", 1}, {"bob", 2}, {"carol", 3}});
    if (!checked) {
        std::cerr << "build failed: " << error_message(checked.error()) << "\n";
        return 1;
    }
    show(*checked, "carol");
    show(*checked, "dave");
    std::cout << "  false positive rate: " << checked->statistics().false_positive_rate << "\n\n";

    // 3. set() never validates; update() does
    std::cout << "3. Writes\n";
    checked->set("bob", 20);
    show(*checked, "bob");

    auto victim = checked->slot_for("zeta");
    checked->set("zeta", 99);
    std::cout << "  set(\"zeta\", 99) overwrote slot " << victim.value << "\n";

    if (auto ok = checked->update("mallory", 7); !ok) {
        std::cout << "  update(\"mallory\") -> " << error_message(ok.error()) << "\n";
    }

    std::cout << "  values:";
    for (int v : *checked) std::cout << " " << v;
    std::cout << "\n  size stays " << checked->size() << "\n\n";

    // 4. Errors surface as values
    std::cout << "4. Build errors\n";
    auto dup = perfect_map<int>::build({{"x", 1}, {"x", 2}});
    std::cout << "  duplicate keys -> " << error_message(dup.error()) << "\n";

    std::vector<std::string> keys{"a", "b", "c"};
    std::vector<int> values{1, 2};
    auto mismatched = perfect_map<int>::build_from(keys, values);
    std::cout << "  3 keys, 2 values -> " << error_message(mismatched.error()) << "\n\n";

    // 5. Blobs
    std::cout << "5. Serialization\n";
    auto blob = checked->serialize();
    auto restored = perfect_map<int>::deserialize(blob);
    std::cout << "  " << blob.size() << " bytes, restored "
              << (restored && *restored == *checked ? "identical" : "DIFFERENT") << "\n";

    return 0;
}
