#include "spvmerkle/config.hpp"
#include "spvmerkle/hasher.hpp"
#include "spvmerkle/logger.h"
#include "spvmerkle/merkle_tree.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace spvmerkle;

static void usage() {
  std::cout << "Usage: spvmerkle_ctl root <leaf>...\n"
            << "       spvmerkle_ctl path <index> <leaf>...\n"
            << "       spvmerkle_ctl proof <index> <leaf>...\n"
            << "       spvmerkle_ctl verify <index> <root> <digest>...\n"
            << "       spvmerkle_ctl selftest\n";
}

static std::vector<Bytes> collectLeaves(int argc, char **argv, int first) {
  std::vector<Bytes> leaves;
  for (int i = first; i < argc; ++i)
    leaves.push_back(to_bytes(argv[i]));
  return leaves;
}

static MerkleTree buildTree(const TreeOptions &opts,
                            const std::vector<Bytes> &leaves) {
  MerkleTree tree(opts.depth, make_hasher(opts.hashAlgorithm), "ctl");
  tree.loadLeaves(leaves);
  tree.build();
  return tree;
}

static int verify_command(const TreeOptions &opts, size_t index,
                          const std::string &rootHex, int argc, char **argv,
                          int first) {
  std::vector<Digest> proof;
  for (int i = first; i < argc; ++i)
    proof.push_back(hex_to_digest(argv[i]));
  Digest root = hex_to_digest(rootHex);
  auto hasher = make_hasher(opts.hashAlgorithm);
  Digest computed = MerkleTree::verifyProof(*hasher, index, proof, root);
  bool ok = computed == root;
  std::cout << (ok ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  if (!ok)
    std::cout << "Computed root " << digest_to_hex(computed) << std::endl;
  return ok ? 0 : 1;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }

  TreeOptions opts;
  try {
    opts = loadTreeOptions();
    Logger::init(opts.logFile, opts.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Configuration failed: " << e.what() << std::endl;
    return 1;
  }

  std::string cmd = argv[1];
  try {
    if (cmd == "selftest") {
      bool ok = hasher_self_test();
      std::cout << (ok ? "Self test passed" : "Self test FAILED") << std::endl;
      return ok ? 0 : 1;
    } else if (cmd == "root") {
      MerkleTree tree = buildTree(opts, collectLeaves(argc, argv, 2));
      std::cout << digest_to_hex(tree.getRoot()) << std::endl;
      return 0;
    } else if (cmd == "path" && argc >= 4) {
      size_t index = std::stoul(argv[2]);
      MerkleTree tree = buildTree(opts, collectLeaves(argc, argv, 3));
      for (const auto &p : tree.getHashPath(index)) {
        std::cout << digest_to_hex(p.first) << ' ' << digest_to_hex(p.second)
                  << std::endl;
      }
      return 0;
    } else if (cmd == "proof" && argc >= 4) {
      size_t index = std::stoul(argv[2]);
      MerkleTree tree = buildTree(opts, collectLeaves(argc, argv, 3));
      for (const auto &d : tree.generateProof(index))
        std::cout << digest_to_hex(d) << std::endl;
      return 0;
    } else if (cmd == "verify" && argc >= 5) {
      return verify_command(opts, std::stoul(argv[2]), argv[3], argc, argv, 4);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Unknown command" << std::endl;
  usage();
  return 1;
}
