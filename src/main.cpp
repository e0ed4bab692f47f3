#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <flowtx/core/account_key.hpp>
#include <flowtx/core/argument.hpp>
#include <flowtx/core/errors.hpp>
#include <flowtx/core/hash.hpp>
#include <flowtx/core/keys.hpp>
#include <flowtx/core/log.hpp>
#include <flowtx/core/signer.hpp>
#include <flowtx/core/transaction.hpp>

using namespace flowtx::core;

static void print_usage() {
  std::printf(
    "flowtx CLI\n\n"
    "Usage:\n"
    "  flowtx-cli keygen      [--sig-algo NAME]\n"
    "  flowtx-cli encode-arg  --type TYPE --value VALUE\n"
    "  flowtx-cli account-key --public-key HEX [--sig-algo NAME] [--hash-algo NAME] [--weight N]\n"
    "  flowtx-cli sign        --script FILE --ref-block HEX --proposer ADDR --payer ADDR\n"
    "                         [--gas N] [--key-index N] [--sequence N] [--authorizer ADDR]...\n"
    "                         [--arg TYPE:VALUE]... [--payload-signer ADDR:INDEX:KEYFILE]...\n"
    "                         [--envelope-signer ADDR:INDEX:KEYFILE]...\n\n"
    "Options:\n"
    "  --sig-algo   ECDSA_P256 | ECDSA_secp256k1 (default: ECDSA_P256)\n"
    "  --hash-algo  SHA2_256 | SHA3_256 (default: SHA3_256)\n"
    "  --type       Bool, String, UFix64, Fix64, UInt64, Int64, Address\n"
    "  --gas        Gas limit (default: 1000)\n"
    "  --log-level  trace|debug|info|warn|error|off (default: warn)\n"
    "  KEYFILE      file holding the hex private key of the signer\n"
  );
}

namespace {

  // Matches "--name VALUE" and "--name=VALUE"; advances i past a separate value.
  std::optional<std::string> take_option(const std::string& arg, const std::string& name,
                                         int argc, char** argv, int& i) {
    const std::string prefix = name + "=";
    if (arg.rfind(prefix, 0) == 0) return arg.substr(prefix.size());
    if (arg == name && i + 1 < argc) return std::string(argv[++i]);
    return std::nullopt;
  }

  std::vector<std::string> split(const std::string& text, char separator, size_t max_parts) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : text) {
      if (c == separator && parts.size() + 1 < max_parts) { parts.push_back(cur); cur.clear(); }
      else { cur.push_back(c); }
    }
    parts.push_back(cur);
    return parts;
  }

  std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw InvalidArgument("cannot open " + path);
    std::streamsize size = in.tellg();
    if (size < 0) throw InvalidArgument("cannot read " + path);
    std::string contents(static_cast<size_t>(size), '\0');
    in.seekg(0);
    if (!in.read(contents.data(), size)) throw InvalidArgument("cannot read " + path);
    return contents;
  }

  Argument parse_argument(const std::string& type, const std::string& value) {
    if (type == "Bool") {
      if (value != "true" && value != "false") throw InvalidArgument("Bool expects true or false");
      return Argument::boolean(value == "true");
    }
    if (type == "String") return Argument::string(value);
    if (type == "UFix64") return Argument::ufix64(std::stod(value));
    if (type == "Fix64") return Argument::fix64(std::stod(value));
    if (type == "UInt64") {
      if (!value.empty() && value[0] == '-') throw InvalidArgument("UInt64 expects a non-negative value");
      return Argument::uint64(std::stoull(value));
    }
    if (type == "Int64") return Argument::int64(std::stoll(value));
    if (type == "Address") return Argument::address(value);
    throw InvalidArgument("unsupported argument type: " + type);
  }

  SignerCredential parse_signer(const std::string& spec, const KeySpec& key_spec) {
    auto parts = split(spec, ':', 3);
    if (parts.size() != 3) throw InvalidArgument("signer must be ADDR:INDEX:KEYFILE, got " + spec);
    auto key_index = static_cast<uint32_t>(std::stoul(parts[1]));
    return SignerCredential{parts[0], key_index, read_private_key_file(parts[2]), key_spec};
  }

  void print_signatures(const char* label, const std::vector<TransactionSignature>& signatures) {
    for (size_t i = 0; i < signatures.size(); ++i) {
      const auto& sig = signatures[i];
      std::cout << label << "[" << i << "]: 0x" << to_hex(sig.address)
                << " key=" << sig.key_index << " sig=" << to_hex(sig.signature) << "\n";
    }
  }
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 0;
  }

  const std::string command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  KeySpec key_spec;
  std::string log_level = "warn";

  // sign
  std::string script_path;
  std::string ref_block_hex;
  std::string proposer_hex;
  std::string payer_hex;
  uint64_t gas_limit = 1000;
  uint32_t key_index = 0;
  uint64_t sequence_number = 0;
  std::vector<std::string> authorizers;
  std::vector<std::string> argument_specs;
  std::vector<std::string> payload_signer_specs;
  std::vector<std::string> envelope_signer_specs;

  // encode-arg / account-key
  std::string arg_type;
  std::optional<std::string> arg_value;
  std::string public_key_hex;
  uint32_t weight = kDefaultKeyWeight;

  try {
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      std::optional<std::string> v;
      if ((v = take_option(arg, "--sig-algo", argc, argv, i))) {
        key_spec.signature = signature_algorithm_from_name(*v);
      } else if ((v = take_option(arg, "--hash-algo", argc, argv, i))) {
        key_spec.hash = hash_algorithm_from_name(*v);
      } else if ((v = take_option(arg, "--log-level", argc, argv, i))) {
        log_level = *v;
      } else if ((v = take_option(arg, "--script", argc, argv, i))) {
        script_path = *v;
      } else if ((v = take_option(arg, "--ref-block", argc, argv, i))) {
        ref_block_hex = *v;
      } else if ((v = take_option(arg, "--proposer", argc, argv, i))) {
        proposer_hex = *v;
      } else if ((v = take_option(arg, "--payer", argc, argv, i))) {
        payer_hex = *v;
      } else if ((v = take_option(arg, "--gas", argc, argv, i))) {
        gas_limit = std::stoull(*v);
      } else if ((v = take_option(arg, "--key-index", argc, argv, i))) {
        key_index = static_cast<uint32_t>(std::stoul(*v));
      } else if ((v = take_option(arg, "--sequence", argc, argv, i))) {
        sequence_number = std::stoull(*v);
      } else if ((v = take_option(arg, "--authorizer", argc, argv, i))) {
        authorizers.push_back(*v);
      } else if ((v = take_option(arg, "--arg", argc, argv, i))) {
        argument_specs.push_back(*v);
      } else if ((v = take_option(arg, "--payload-signer", argc, argv, i))) {
        payload_signer_specs.push_back(*v);
      } else if ((v = take_option(arg, "--envelope-signer", argc, argv, i))) {
        envelope_signer_specs.push_back(*v);
      } else if ((v = take_option(arg, "--type", argc, argv, i))) {
        arg_type = *v;
      } else if ((v = take_option(arg, "--value", argc, argv, i))) {
        arg_value = *v;
      } else if ((v = take_option(arg, "--public-key", argc, argv, i))) {
        public_key_hex = *v;
      } else if ((v = take_option(arg, "--weight", argc, argv, i))) {
        weight = static_cast<uint32_t>(std::stoul(*v));
      } else if (arg == "-h" || arg == "--help") {
        print_usage();
        return 0;
      } else {
        std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
        print_usage();
        return 1;
      }
    }
    init_logging(log_level);
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }

  if (!crypto_init()) {
    std::fprintf(stderr, "crypto_init failed\n");
    return 1;
  }

  try {
    if (command == "keygen") {
      auto key_pair = generate_keypair(key_spec.signature);
      std::cout << "Algorithm: " << to_string(key_spec.signature) << "\n";
      std::cout << "Private Key: " << key_pair.private_key.hex() << "\n";
      std::cout << "Public Key:  " << to_hex(key_pair.public_key) << "\n";
      return 0;
    }

    if (command == "encode-arg") {
      if (arg_type.empty() || !arg_value) {
        std::fprintf(stderr, "encode-arg requires --type and --value\n");
        return 1;
      }
      std::cout << parse_argument(arg_type, *arg_value).to_json_string() << "\n";
      return 0;
    }

    if (command == "account-key") {
      if (public_key_hex.empty()) {
        std::fprintf(stderr, "account-key requires --public-key\n");
        return 1;
      }
      std::cout << encode_account_key(std::string_view(public_key_hex), key_spec, weight) << "\n";
      return 0;
    }

    if (command == "sign") {
      if (script_path.empty() || ref_block_hex.empty() || proposer_hex.empty() || payer_hex.empty()) {
        std::fprintf(stderr, "sign requires --script, --ref-block, --proposer and --payer\n");
        return 1;
      }

      std::vector<Argument> arguments;
      for (const auto& spec : argument_specs) {
        auto parts = split(spec, ':', 2);
        if (parts.size() != 2) throw InvalidArgument("argument must be TYPE:VALUE, got " + spec);
        arguments.push_back(parse_argument(parts[0], parts[1]));
      }

      std::vector<SignerCredential> payload_signers;
      for (const auto& spec : payload_signer_specs) payload_signers.push_back(parse_signer(spec, key_spec));
      std::vector<SignerCredential> envelope_signers;
      for (const auto& spec : envelope_signer_specs) envelope_signers.push_back(parse_signer(spec, key_spec));

      auto ref_block = from_hex(ref_block_hex);
      ProposalKey proposer{address_from_hex(proposer_hex), key_index, sequence_number};
      auto transaction = build_transaction(read_file(script_path), arguments, ref_block, gas_limit,
                                           proposer, authorizers, payer_hex);

      std::cout << "payload:  " << to_hex(transaction.payload_message()) << "\n";
      transaction = sign_transaction(std::move(transaction), payload_signers, envelope_signers);
      std::cout << "envelope: " << to_hex(transaction.envelope_message()) << "\n";
      print_signatures("payload_signature", transaction.payload_signatures);
      print_signatures("envelope_signature", transaction.envelope_signatures);
      return 0;
    }
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }

  std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
  print_usage();
  return 1;
}
