#ifndef DSPFSTRUCTUREMDL_H
#define DSPFSTRUCTUREMDL_H

/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include <QAbstractItemModel>
#include <DspfAst.h>

namespace Dspf
{
struct ModelItem
{
    enum Kind { Root, FileNode, RecordsGroup, AttributesGroup, ItemsGroup, IndicatorsGroup,
                RecordNode, FieldNode, ConstantNode, AttributeNode, IndicatorNode };
    quint8 d_kind;
    int d_elem; // index into Document::elements or -1
    int d_sub; // index of the attribute or indicator within the element or -1
    QList<ModelItem*> d_children; // owns
    ModelItem* d_parent;
    ModelItem(ModelItem* p = 0, quint8 k = Root, int elem = -1, int sub = -1):
        d_kind(k),d_elem(elem),d_sub(sub),d_parent(p) { if( p ) p->d_children.append(this); }
    ~ModelItem() { clear(); }
    void clear();
    bool isGroup() const { return d_kind >= RecordsGroup && d_kind <= IndicatorsGroup; }
};

class StructureMdl : public QAbstractItemModel
{
    Q_OBJECT
public:
    enum Role { LineRole = Qt::UserRole, DescriptionRole, KindRole };

    explicit StructureMdl(QObject *parent = 0);

    void load(const Document&, const QString& fileName = QString());
    void clear();
    const Document& getDocument() const { return d_doc; }
    const Element* getElement(const QModelIndex&) const;
    const Attribute* getAttribute(const QModelIndex&) const;
    int getLine(const QModelIndex&) const; // -1 for group nodes
    QModelIndex findRecord(const QString& name) const;

    void setRecordFilter(const QStringList& names); // empty shows all records
    const QStringList& getRecordFilter() const { return d_recordFilter; }
    void setKindVisible(Element::Kind kind, bool on); // FieldDecl or ConstDecl
    bool isKindVisible(Element::Kind kind) const;
    void showAll();

    // overrides
    int columnCount ( const QModelIndex & parent = QModelIndex() ) const { return 1; }
    QVariant data ( const QModelIndex & index, int role = Qt::DisplayRole ) const;
    QModelIndex index ( int row, int column, const QModelIndex & parent = QModelIndex() ) const;
    QModelIndex parent ( const QModelIndex & index ) const;
    int rowCount ( const QModelIndex & parent = QModelIndex() ) const;
    Qt::ItemFlags flags ( const QModelIndex & index ) const { return Qt::ItemIsEnabled | Qt::ItemIsSelectable; }

protected:
    void rebuild();
    void fillRecord(ModelItem* records, int elem);
    void fillItem(ModelItem* items, int elem);
    void fillAttributes(ModelItem* parentItem, int elem);
    QString label(const ModelItem*) const;
    const ModelItem* toItem(const QModelIndex&) const;
private:
    ModelItem d_root;
    Document d_doc;
    QString d_fileName;
    QStringList d_recordFilter;
    bool d_showFields;
    bool d_showConstants;
};
}

#endif // DSPFSTRUCTUREMDL_H
