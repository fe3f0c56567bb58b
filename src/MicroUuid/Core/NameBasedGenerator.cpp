// matth-x/MicroUuid
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroUuid/Core/NameBasedGenerator.h>
#include <MicroUuid/Debug.h>

namespace MicroUuid {

UuidStatus generateNameBased(const Uuid& ns, const unsigned char *name, size_t nameLen, DigestFunction& digest, UuidVersion version, Uuid& out) {

    if (!name && nameLen) {
        MU_DBG_ERR("invalid args");
        return UuidStatus(UuidError::InvalidLength, nameLen);
    }

    DigestInput parts [] = {
        {ns.bytes(), MU_UUID_SIZE},
        {name, nameLen}
    };

    unsigned char hash [MU_DIGEST_MAX_SIZE];

    int ret = digest.digest(parts, sizeof(parts) / sizeof(parts[0]), hash, sizeof(hash));
    if (ret < MU_UUID_SIZE) {
        MU_DBG_ERR("digest failed: %i", ret);
        return UuidStatus(UuidError::DigestUnavailable);
    }

    out = Uuid::fromBytes(hash);
    out.setVersion(version).setVariant();
    return UuidStatus();
}

UuidStatus generateV3(const Uuid& ns, const unsigned char *name, size_t nameLen, DigestFunction& md5, Uuid& out) {
    return generateNameBased(ns, name, nameLen, md5, UuidVersion::Md5, out);
}

UuidStatus generateV5(const Uuid& ns, const unsigned char *name, size_t nameLen, DigestFunction& sha1, Uuid& out) {
    return generateNameBased(ns, name, nameLen, sha1, UuidVersion::Sha1, out);
}

} //namespace MicroUuid
