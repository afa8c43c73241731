#include <cassert>
#include <iostream>
#include "application/HelmChartReconciler.hpp"
#include "application/HelmRepositoryReconciler.hpp"
#include "infrastructure/ArtifactStorage.hpp"
#include "infrastructure/Checksum.hpp"
#include "test/TestSupport.hpp"

using namespace chartkeeper;
namespace fs = std::filesystem;

namespace {

const domain::ResourceKind kRepo = domain::ResourceKind::HelmRepository;
const domain::ResourceKind kChart = domain::ResourceKind::HelmChart;

struct Fixture {
    test::TempDir root;
    std::shared_ptr<infrastructure::ArtifactStorage> storage =
        std::make_shared<infrastructure::ArtifactStorage>(root.str(), "http://h");
    std::shared_ptr<test::InMemoryResourceStore> store = std::make_shared<test::InMemoryResourceStore>();
    std::shared_ptr<test::ScriptedFetcher> fetcher = std::make_shared<test::ScriptedFetcher>();
    std::shared_ptr<test::MapCredentialResolver> credentials = std::make_shared<test::MapCredentialResolver>();
    application::HelmRepositoryReconciler repositories{store, storage, credentials, fetcher, Options()};
    application::HelmChartReconciler charts{store, storage, credentials, fetcher, Options()};

    static application::ReconcilerOptions Options() {
        application::ReconcilerOptions options;
        options.retryInterval = std::chrono::seconds(30);
        return options;
    }

    static std::string RepoURL(const std::string& ns) { return "https://charts.example.com/" + ns; }

    void publish(const std::string& ns, const std::vector<std::string>& versions) {
        fetcher->setBody(RepoURL(ns) + "/index.yaml", test::MakeIndex("podinfo", versions));
        for (const auto& v : versions) {
            fetcher->setBody(RepoURL(ns) + "/charts/podinfo-" + v + ".tgz", ns + " package " + v);
        }
    }

    domain::ResourceKey addRepository(const std::string& ns) {
        domain::ManagedResource repo;
        repo.kind = kRepo;
        repo.key = {ns, "podinfo"};
        repo.spec.url = RepoURL(ns);
        store->put(repo);
        return repo.key;
    }

    domain::ResourceKey addChart(const std::string& ns, const std::string& name, const std::string& chart,
                                 const std::string& version) {
        domain::ManagedResource resource;
        resource.kind = kChart;
        resource.key = {ns, name};
        resource.spec.chart = chart;
        resource.spec.version = version;
        resource.spec.sourceRef = "podinfo";
        resource.spec.interval = std::chrono::seconds(120);
        store->put(resource);
        return resource.key;
    }

    domain::ResourceStatus chartStatus(const domain::ResourceKey& key) { return store->get(kChart, key)->status; }

    fs::path chartDir(const domain::ResourceKey& key) { return root.path() / "helmchart" / key.ns / key.name; }
};

std::string FailureReason(const domain::ResourceStatus& status) {
    auto c = status.conditions.get(domain::kFetchFailedCondition);
    return c ? c->reason : std::string();
}

void TestEndToEnd() {
    Fixture f;
    auto repoKey = f.addRepository("default");
    auto chartKey = f.addChart("default", "podinfo", "podinfo", "");
    f.publish("default", {"0.1.0", "0.2.0", "0.3.0"});

    // The repository has not produced an index yet.
    auto outcome = f.charts.reconcile(chartKey);
    assert(outcome.failed());
    assert(outcome.result.requeueAfter == std::chrono::seconds(30));
    assert(FailureReason(f.chartStatus(chartKey)) == domain::kSourceUnavailableReason);
    std::cout << "[PASS] Chart waits for its repository." << std::endl;

    assert(!f.repositories.reconcile(repoKey).failed());

    outcome = f.charts.reconcile(chartKey);
    assert(!outcome.failed());
    assert(outcome.result == application::ReconcileResult::After(std::chrono::seconds(120)));
    auto status = f.chartStatus(chartKey);
    std::string sum = infrastructure::Checksum::Sha256("default package 0.3.0");
    assert(status.artifact);
    assert(status.artifact->revision == "0.3.0");
    assert(status.artifact->checksum == sum);
    assert(status.artifact->path == "helmchart/default/podinfo/podinfo-0.3.0-" + sum + ".tgz");
    assert(status.url == "http://h/helmchart/default/podinfo/helmchart-latest.tgz");
    assert(status.conditions.get(domain::kReadyCondition)->message == "Stored artifact for revision '0.3.0'");
    assert(!status.conditions.has(domain::kFetchFailedCondition));
    assert(!status.conditions.has(domain::kArtifactOutdatedCondition));
    std::cout << "[PASS] Latest chart version persisted." << std::endl;

    int writes = f.store->statusWrites();
    assert(!f.charts.reconcile(chartKey).failed());
    assert(f.store->statusWrites() == writes);
    assert(f.chartStatus(chartKey) == status);
    std::cout << "[PASS] Second pass changes nothing." << std::endl;

    f.publish("default", {"0.1.0", "0.2.0", "0.3.0", "0.4.0"});
    assert(!f.repositories.reconcile(repoKey).failed());
    assert(!f.charts.reconcile(chartKey).failed());
    status = f.chartStatus(chartKey);
    assert(status.artifact->revision == "0.4.0");
    auto files = test::RegularFiles(f.chartDir(chartKey));
    assert(files.size() == 1);
    assert(files[0] == fs::path(status.artifact->path).filename().string());
    fs::path link = f.chartDir(chartKey) / "helmchart-latest.tgz";
    assert(fs::is_symlink(link));
    assert(fs::read_symlink(link) == fs::path(f.storage->localPath(*status.artifact)));
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(f.chartDir(chartKey))) {
        (void)entry;
        ++entries;
    }
    assert(entries == 2);
    std::cout << "[PASS] New version replaces the old one, one file plus the link remain." << std::endl;
}

void TestVersionSelection() {
    Fixture f;
    auto repoKey = f.addRepository("default");
    f.publish("default", {"0.1.0", "0.2.0", "0.3.0"});
    f.repositories.reconcile(repoKey);

    auto pinned = f.addChart("default", "pinned", "podinfo", "0.2.0");
    assert(!f.charts.reconcile(pinned).failed());
    assert(f.chartStatus(pinned).artifact->revision == "0.2.0");
    assert(f.storage->readFile(*f.chartStatus(pinned).artifact) == "default package 0.2.0");

    auto absentVersion = f.addChart("default", "absent-version", "podinfo", "9.9.9");
    auto outcome = f.charts.reconcile(absentVersion);
    assert(outcome.failed());
    assert(outcome.result.isZero());
    assert(FailureReason(f.chartStatus(absentVersion)) == domain::kChartPullFailedReason);

    auto absentChart = f.addChart("default", "absent-chart", "nginx", "");
    outcome = f.charts.reconcile(absentChart);
    assert(outcome.failed());
    assert(FailureReason(f.chartStatus(absentChart)) == domain::kChartPullFailedReason);
    assert(!fs::exists(f.chartDir(absentChart)));
    std::cout << "[PASS] Exact versions resolved, unknown entries fail." << std::endl;
}

void TestRepositoryCredentialsAndFailures() {
    Fixture f;
    auto repoKey = f.addRepository("secure");
    auto repo = *f.store->get(kRepo, repoKey);
    repo.spec.secretRef = "repo-auth";
    repo.spec.timeout = std::chrono::seconds(7);
    f.store->put(repo);

    domain::FetchOptions options;
    options.username = "reader";
    options.password = "secret";
    f.credentials->add("secure", "repo-auth", options);
    f.publish("secure", {"1.0.0"});
    assert(!f.repositories.reconcile(repoKey).failed());

    auto chartKey = f.addChart("secure", "podinfo", "podinfo", "");
    assert(!f.charts.reconcile(chartKey).failed());
    assert(f.fetcher->lastOptions().username == "reader");
    assert(f.fetcher->lastTimeout() == std::chrono::seconds(7));
    std::cout << "[PASS] Chart download uses the repository credentials." << std::endl;

    auto good = f.chartStatus(chartKey);
    f.publish("secure", {"1.0.0", "1.1.0"});
    f.repositories.reconcile(repoKey);
    f.fetcher->setError(Fixture::RepoURL("secure") + "/charts/podinfo-1.1.0.tgz",
                        domain::TransportError::Kind::NetworkError, "connection reset");
    auto outcome = f.charts.reconcile(chartKey);
    assert(outcome.failed());
    assert(outcome.result.requeueAfter == std::chrono::seconds(30));
    auto status = f.chartStatus(chartKey);
    assert(status.artifact == good.artifact);
    assert(FailureReason(status) == domain::kFailedReason);
    assert(status.conditions.isFalse(domain::kReadyCondition));
    std::cout << "[PASS] Failed download keeps the previous chart." << std::endl;

    f.store->remove(kRepo, repoKey);
    outcome = f.charts.reconcile(chartKey);
    assert(outcome.failed());
    assert(FailureReason(f.chartStatus(chartKey)) == domain::kSourceUnavailableReason);
    std::cout << "[PASS] Missing repository reported as unavailable source." << std::endl;
}

void TestNamespacesAreIsolated() {
    Fixture f;
    auto a = f.addRepository("team-a");
    auto b = f.addRepository("team-b");
    f.publish("team-a", {"1.0.0"});
    f.publish("team-b", {"2.0.0"});
    f.repositories.reconcile(a);
    f.repositories.reconcile(b);

    auto chartA = f.addChart("team-a", "podinfo", "podinfo", "");
    auto chartB = f.addChart("team-b", "podinfo", "podinfo", "");
    f.charts.reconcile(chartA);
    f.charts.reconcile(chartB);

    auto statusA = f.chartStatus(chartA);
    auto statusB = f.chartStatus(chartB);
    assert(statusA.artifact->revision == "1.0.0");
    assert(statusB.artifact->revision == "2.0.0");
    assert(statusA.url != statusB.url);
    assert(f.storage->exists(*statusA.artifact));
    assert(f.storage->exists(*statusB.artifact));
    std::cout << "[PASS] Same-named resources in different namespaces stay apart." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting HelmChart Reconciler Test..." << std::endl;

    TestEndToEnd();
    TestVersionSelection();
    TestRepositoryCredentialsAndFailures();
    TestNamespacesAreIsolated();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
