/**
 * @file PackageSignatureReader.cpp
 * @brief OpenSSL PKCS#7 walk over the primary signer and its countersignatures.
 */

#include "infrastructure/PackageSignatureReader.hpp"
#include <memory>
#include <stdexcept>
#include <openssl/asn1.h>
#include <openssl/objects.h>
#include <openssl/pkcs7.h>
#include <openssl/x509.h>

namespace symbolgate::infrastructure {

namespace {

struct Pkcs7Deleter {
    void operator()(PKCS7* p) const { PKCS7_free(p); }
};
struct SignerInfoDeleter {
    void operator()(PKCS7_SIGNER_INFO* p) const { PKCS7_SIGNER_INFO_free(p); }
};
struct ObjectDeleter {
    void operator()(ASN1_OBJECT* p) const { ASN1_OBJECT_free(p); }
};
struct SequenceDeleter {
    void operator()(ASN1_SEQUENCE_ANY* p) const { sk_ASN1_TYPE_pop_free(p, ASN1_TYPE_free); }
};

using ObjectPtr = std::unique_ptr<ASN1_OBJECT, ObjectDeleter>;

ObjectPtr MakeObject(const char* oid) {
    ObjectPtr obj(OBJ_txt2obj(oid, 1));
    if (!obj) throw std::runtime_error(std::string("Invalid OID ") + oid);
    return obj;
}

// CommitmentTypeIndication ::= SEQUENCE { commitmentTypeId OBJECT IDENTIFIER, ... }
bool HasRepositoryCommitment(const PKCS7_SIGNER_INFO* si) {
    if (!si->auth_attr) return false;
    auto attributeOid = MakeObject(PackageSignatureReader::kCommitmentTypeOid);
    auto* value = static_cast<ASN1_STRING*>(
        X509at_get0_data_by_OBJ(si->auth_attr, attributeOid.get(), -3, V_ASN1_SEQUENCE));
    if (!value) return false;

    const unsigned char* p = ASN1_STRING_get0_data(value);
    std::unique_ptr<ASN1_SEQUENCE_ANY, SequenceDeleter> sequence(
        d2i_ASN1_SEQUENCE_ANY(nullptr, &p, ASN1_STRING_length(value)));
    if (!sequence || sk_ASN1_TYPE_num(sequence.get()) < 1) return false;

    const ASN1_TYPE* commitment = sk_ASN1_TYPE_value(sequence.get(), 0);
    if (ASN1_TYPE_get(commitment) != V_ASN1_OBJECT) return false;
    auto receipt = MakeObject(PackageSignatureReader::kProofOfReceiptOid);
    return OBJ_cmp(commitment->value.object, receipt.get()) == 0;
}

std::optional<std::string> ServiceIndexOf(const PKCS7_SIGNER_INFO* si) {
    auto urlOid = MakeObject(PackageSignatureReader::kServiceIndexUrlOid);
    auto* value = static_cast<ASN1_STRING*>(
        X509at_get0_data_by_OBJ(si->auth_attr, urlOid.get(), -3, V_ASN1_IA5STRING));
    if (!value) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(value)),
                       static_cast<std::size_t>(ASN1_STRING_length(value)));
}

std::optional<std::string> FromCountersignatures(const PKCS7_SIGNER_INFO* primary) {
    const STACK_OF(X509_ATTRIBUTE)* unsignedAttributes = primary->unauth_attr;
    if (!unsignedAttributes) return std::nullopt;

    for (int i = 0; i < X509at_get_attr_count(unsignedAttributes); ++i) {
        X509_ATTRIBUTE* attribute = X509at_get_attr(unsignedAttributes, i);
        if (OBJ_obj2nid(X509_ATTRIBUTE_get0_object(attribute)) != NID_pkcs9_countersignature) continue;

        for (int j = 0; j < X509_ATTRIBUTE_count(attribute); ++j) {
            ASN1_TYPE* value = X509_ATTRIBUTE_get0_type(attribute, j);
            if (!value || ASN1_TYPE_get(value) != V_ASN1_SEQUENCE) continue;

            const unsigned char* p = ASN1_STRING_get0_data(value->value.sequence);
            std::unique_ptr<PKCS7_SIGNER_INFO, SignerInfoDeleter> countersigner(
                d2i_PKCS7_SIGNER_INFO(nullptr, &p, ASN1_STRING_length(value->value.sequence)));
            if (countersigner && HasRepositoryCommitment(countersigner.get())) {
                return ServiceIndexOf(countersigner.get());
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> PackageSignatureReader::ReadServiceIndexUrl(const std::string& der) {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(der.data());
    std::unique_ptr<PKCS7, Pkcs7Deleter> p7(d2i_PKCS7(nullptr, &p, static_cast<long>(der.size())));
    if (!p7) {
        throw std::runtime_error("Package signature is not a PKCS#7 structure");
    }
    if (!PKCS7_type_is_signed(p7.get())) {
        throw std::runtime_error("Package signature is not SignedData");
    }

    STACK_OF(PKCS7_SIGNER_INFO)* signers = PKCS7_get_signer_info(p7.get());
    if (!signers || sk_PKCS7_SIGNER_INFO_num(signers) < 1) return std::nullopt;

    const PKCS7_SIGNER_INFO* primary = sk_PKCS7_SIGNER_INFO_value(signers, 0);
    if (HasRepositoryCommitment(primary)) {
        return ServiceIndexOf(primary);
    }
    // Author-signed packages carry the repository signature as a countersignature
    return FromCountersignatures(primary);
}

} // namespace symbolgate::infrastructure
