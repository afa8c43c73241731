#include <cassert>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include "infrastructure/ArtifactStorage.hpp"
#include "infrastructure/ArtifactPaths.hpp"
#include "domain/Errors.hpp"
#include "test/TestSupport.hpp"

using namespace chartkeeper;
namespace fs = std::filesystem;

namespace {

const domain::ResourceKind kRepo = domain::ResourceKind::HelmRepository;

void TestPathsAndURLs(const test::TempDir& root) {
    infrastructure::ArtifactStorage storage(root.str(), "http://chartkeeper.local/");
    auto artifact = storage.newArtifactFor(kRepo, {"default", "podinfo"}, "abc", "index-abc.yaml");
    assert(artifact.path == "helmrepository/default/podinfo/index-abc.yaml");
    assert(artifact.revision == "abc");
    assert(artifact.url == "http://chartkeeper.local/helmrepository/default/podinfo/index-abc.yaml");

    assert(infrastructure::ArtifactPaths::ArtifactURL("http://h", "/a/b") == "http://h/a/b");
    assert(infrastructure::ArtifactPaths::ArtifactURL("http://h//", "a/b") == "http://h/a/b");
    assert(infrastructure::ArtifactPaths::LatestLinkName(domain::ResourceKind::HelmChart, "tgz") == "helmchart-latest.tgz");
    assert(infrastructure::ArtifactPaths::Extension("index-abc.yaml") == "yaml");
    assert(infrastructure::ArtifactPaths::Extension("noext") == "");

    storage.setHostname("http://new");
    storage.setArtifactURL(artifact);
    assert(artifact.url == "http://new/helmrepository/default/podinfo/index-abc.yaml");
    std::cout << "[PASS] Paths and URLs." << std::endl;
}

void TestWriteAndRead(const test::TempDir& root) {
    infrastructure::ArtifactStorage storage(root.str(), "http://h");
    auto artifact = storage.newArtifactFor(kRepo, {"default", "write"}, "r1", "index-r1.yaml");
    assert(!storage.exists(artifact));

    storage.atomicWrite(artifact, "content", 0640);
    assert(storage.exists(artifact));
    assert(storage.readFile(artifact) == "content");

    struct stat st{};
    assert(::stat(storage.localPath(artifact).c_str(), &st) == 0);
    assert((st.st_mode & 0777) == 0640);

    storage.atomicWrite(artifact, "replaced");
    assert(storage.readFile(artifact) == "replaced");
    assert(storage.checksum("c") == "2e7d2c03a9507ae265ecf5b5356885a53393a2029d241394997265a1a25aefc6");

    domain::Artifact escaping;
    escaping.path = "../outside.txt";
    assert(!storage.exists(escaping));
    bool thrown = false;
    try {
        storage.atomicWrite(escaping, "x");
    } catch (const domain::StorageIOError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Atomic write, read and traversal guard." << std::endl;
}

void TestGarbageCollection(const test::TempDir& root) {
    infrastructure::ArtifactStorage storage(root.str(), "http://h");
    domain::ResourceKey key{"default", "gc"};
    domain::ResourceKey sibling{"default", "gc-sibling"};

    auto other = storage.newArtifactFor(kRepo, sibling, "s", "index-s.yaml");
    storage.atomicWrite(other, "sibling");

    domain::Artifact current;
    for (int i = 0; i < 4; ++i) {
        current = storage.newArtifactFor(kRepo, key, std::to_string(i), "index-" + std::to_string(i) + ".yaml");
        storage.atomicWrite(current, "rev" + std::to_string(i));
    }
    std::string url = storage.symlink(current, "helmrepository-latest.yaml");
    assert(url == "http://h/helmrepository/default/gc/helmrepository-latest.yaml");
    fs::path dir = fs::path(storage.localPath(current)).parent_path();
    fs::create_directories(dir / "nested");

    auto removed = storage.removeAllButCurrent(current);
    assert(removed.size() == 3);
    assert(std::find(removed.begin(), removed.end(), "helmrepository/default/gc/index-0.yaml") != removed.end());

    auto files = test::RegularFiles(dir);
    assert(files.size() == 1 && files[0] == "index-3.yaml");
    assert(fs::is_symlink(dir / "helmrepository-latest.yaml"));
    assert(fs::read_symlink(dir / "helmrepository-latest.yaml") == fs::path(storage.localPath(current)));
    assert(fs::is_directory(dir / "nested"));
    assert(storage.exists(other));
    assert(storage.readFile(other) == "sibling");

    // Nothing left to collect.
    assert(storage.removeAllButCurrent(current).empty());

    // A link is never an artifact.
    auto link = storage.newArtifactFor(kRepo, key, "3", "helmrepository-latest.yaml");
    assert(!storage.exists(link));
    std::cout << "[PASS] Garbage collection scoped to one resource." << std::endl;

    // Relinking replaces the previous link.
    auto next = storage.newArtifactFor(kRepo, key, "4", "index-4.yaml");
    storage.atomicWrite(next, "rev4");
    storage.symlink(next, "helmrepository-latest.yaml");
    assert(fs::read_symlink(dir / "helmrepository-latest.yaml") == fs::path(storage.localPath(next)));
    std::cout << "[PASS] Link replaced atomically." << std::endl;
}

void TestRemoveAll(const test::TempDir& root) {
    infrastructure::ArtifactStorage storage(root.str(), "http://h");
    auto doomed = storage.newArtifactFor(kRepo, {"team", "doomed"}, "1", "index-1.yaml");
    auto kept = storage.newArtifactFor(kRepo, {"team", "kept"}, "1", "index-1.yaml");
    storage.atomicWrite(doomed, "a");
    storage.atomicWrite(kept, "b");

    storage.removeAll(doomed);
    assert(!fs::exists(fs::path(storage.localPath(doomed)).parent_path()));
    assert(storage.exists(kept));

    // Removing again is harmless.
    storage.removeAll(doomed);

    domain::Artifact atRoot;
    atRoot.path = "stray.txt";
    bool refused = false;
    try {
        storage.removeAll(atRoot);
    } catch (const domain::StorageIOError&) {
        refused = true;
    }
    assert(refused);
    assert(fs::exists(root.path()));
    std::cout << "[PASS] removeAll deletes only the resource directory." << std::endl;
}

void TestFailedRenameLeavesNoTemp(const test::TempDir& root) {
    infrastructure::ArtifactStorage storage(root.str(), "http://h");
    auto artifact = storage.newArtifactFor(kRepo, {"default", "blocked"}, "1", "index-1.yaml");
    fs::path target = storage.localPath(artifact);
    fs::create_directories(target);
    std::ofstream(target / "occupant") << "x";

    bool thrown = false;
    try {
        storage.atomicWrite(artifact, "data");
    } catch (const domain::StorageIOError&) {
        thrown = true;
    }
    assert(thrown);

    for (const auto& entry : fs::directory_iterator(target.parent_path())) {
        assert(entry.path().filename().string().find(".tmp-") == std::string::npos);
    }
    std::cout << "[PASS] Failed rename cleans up its temporary file." << std::endl;
}

void TestRelativeRoot(const test::TempDir& root) {
    fs::path previous = fs::current_path();
    fs::current_path(root.path());
    {
        infrastructure::ArtifactStorage storage("relative-artifacts", "http://h");
        assert(fs::path(storage.basePath()).is_absolute());
        assert(fs::equivalent(storage.basePath(), root.path() / "relative-artifacts"));

        auto artifact = storage.newArtifactFor(domain::ResourceKind::HelmChart, {"default", "podinfo"}, "1.0.0",
                                               "podinfo-1.0.0.tgz");
        storage.atomicWrite(artifact, "package");
        storage.symlink(artifact, "helmchart-latest.tgz");

        // Checked from elsewhere, the link must still resolve.
        fs::current_path(previous);
        fs::path link = root.path() / "relative-artifacts/helmchart/default/podinfo/helmchart-latest.tgz";
        assert(fs::is_symlink(fs::symlink_status(link)));
        assert(fs::exists(link));
        std::ifstream in(link, std::ios::binary);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content == "package");
    }
    fs::current_path(previous);
    std::cout << "[PASS] Relative storage root produces resolvable links." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Artifact Storage Test..." << std::endl;
    test::TempDir root;

    TestPathsAndURLs(root);
    TestWriteAndRead(root);
    TestGarbageCollection(root);
    TestRemoveAll(root);
    TestFailedRenameLeavesNoTemp(root);
    TestRelativeRoot(root);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
