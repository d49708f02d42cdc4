// Repository: Seamline
// Component: Fake Fragment Fetcher
// Purpose: IFragmentFetcher that maps a URL to "<dest_dir>/<basename>"
//          without touching the network; selected URLs fail.
// Copyright (c) 2025 Seamline Authors

#ifndef SEAMLINE_TESTS_FIXTURES_FAKE_FRAGMENT_FETCHER_H_
#define SEAMLINE_TESTS_FIXTURES_FAKE_FRAGMENT_FETCHER_H_

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "seamline/fragments/FragmentFetcher.hpp"

namespace seamline::tests::fixtures {

class FakeFragmentFetcher : public fragments::IFragmentFetcher {
 public:
  void FailOn(const std::string& url) { failing_.insert(url); }

  std::optional<std::string> Fetch(const std::string& url,
                                   const std::string& dest_dir) override {
    fetched_.push_back(url);
    if (failing_.count(url) > 0) {
      return std::nullopt;
    }
    return LocalPath(url, dest_dir);
  }

  static std::string LocalPath(const std::string& url, const std::string& dest_dir) {
    return dest_dir + "/" + fragments::AvioFragmentFetcher::LocalNameForUrl(url);
  }

  const std::vector<std::string>& fetched() const { return fetched_; }

 private:
  std::set<std::string> failing_;
  std::vector<std::string> fetched_;
};

}  // namespace seamline::tests::fixtures

#endif  // SEAMLINE_TESTS_FIXTURES_FAKE_FRAGMENT_FETCHER_H_
